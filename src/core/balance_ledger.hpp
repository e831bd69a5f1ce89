#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include "result.hpp"
#include "types.hpp"

namespace xarb {

enum class LedgerError {
    INSUFFICIENT_FUNDS
};

// Free/locked accounting per currency. Every operation holds one mutex, so a
// snapshot never observes a half-applied mutation. Misuse (double release,
// negative amounts, overspending a reservation) throws LedgerInvariantError.
class BalanceLedger {
public:
    BalanceLedger() = default;
    explicit BalanceLedger(const std::map<std::string, double>& initial_free);

    BalanceLedger(const BalanceLedger&) = delete;
    BalanceLedger& operator=(const BalanceLedger&) = delete;

    // Replaces all balances. Not allowed while reservations are outstanding.
    void load(const std::map<std::string, Balance>& balances);

    // Moves amount from free to locked. Never reserves partially.
    Result<Reservation, LedgerError> reserve(const std::string& currency, double amount);

    // Locked back to free.
    void release(const Reservation& reservation);

    // Locked amount leaves the ledger.
    void settle_spend(const Reservation& reservation);

    // Only `spent` leaves the ledger; the rest of the reservation returns to free.
    void settle_spend(const Reservation& reservation, double spent);

    void settle_receive(const std::string& currency, double amount);

    std::map<std::string, Balance> snapshot() const;
    Balance balance(const std::string& currency) const;
    double free(const std::string& currency) const;
    size_t outstanding_reservations() const;

private:
    Reservation take_reservation(const Reservation& reservation);
    Balance& balance_for(const std::string& currency);

    mutable std::mutex mutex_;
    std::map<std::string, Balance> balances_;
    std::unordered_map<uint64_t, Reservation> reservations_;
    uint64_t next_reservation_id_ = 1;
};

std::string to_string(LedgerError error);

} // namespace xarb
