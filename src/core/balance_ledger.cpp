#include "balance_ledger.hpp"
#include <algorithm>
#include <cmath>
#include "exceptions.hpp"

namespace xarb {

namespace {

void check_amount(double amount, const std::string& what) {
    if (!std::isfinite(amount) || amount < 0.0) {
        throw LedgerInvariantError(what + " amount must be finite and non-negative, got " +
                                   std::to_string(amount));
    }
}

} // namespace

std::string to_string(LedgerError error) {
    switch (error) {
        case LedgerError::INSUFFICIENT_FUNDS: return "insufficient_funds";
    }
    return "unknown";
}

BalanceLedger::BalanceLedger(const std::map<std::string, double>& initial_free) {
    for (const auto& [currency, amount] : initial_free) {
        check_amount(amount, "initial " + currency);
        balances_[currency] = Balance{currency, amount, 0.0};
    }
}

void BalanceLedger::load(const std::map<std::string, Balance>& balances) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reservations_.empty()) {
        throw LedgerInvariantError("cannot load balances with " +
                                   std::to_string(reservations_.size()) + " outstanding reservations");
    }

    std::map<std::string, Balance> loaded;
    for (const auto& [currency, balance] : balances) {
        check_amount(balance.free, "free " + currency);
        check_amount(balance.locked, "locked " + currency);
        // Locks cannot survive a restart; whatever was locked is free again.
        loaded[currency] = Balance{currency, balance.free + balance.locked, 0.0};
    }
    balances_ = std::move(loaded);
}

Result<Reservation, LedgerError> BalanceLedger::reserve(const std::string& currency, double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw LedgerInvariantError("reservation amount must be positive, got " + std::to_string(amount));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(currency);
    if (it == balances_.end() || amount > it->second.free + LEDGER_EPSILON) {
        return Result<Reservation, LedgerError>::error(LedgerError::INSUFFICIENT_FUNDS);
    }
    Balance& balance = it->second;

    balance.free = std::max(0.0, balance.free - amount);
    balance.locked += amount;

    Reservation reservation{next_reservation_id_++, currency, amount};
    reservations_.emplace(reservation.id, reservation);
    return Result<Reservation, LedgerError>::success(reservation);
}

void BalanceLedger::release(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(mutex_);
    Reservation held = take_reservation(reservation);
    Balance& balance = balance_for(held.currency);
    balance.locked = std::max(0.0, balance.locked - held.amount);
    balance.free += held.amount;
}

void BalanceLedger::settle_spend(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(mutex_);
    Reservation held = take_reservation(reservation);
    Balance& balance = balance_for(held.currency);
    balance.locked = std::max(0.0, balance.locked - held.amount);
}

void BalanceLedger::settle_spend(const Reservation& reservation, double spent) {
    check_amount(spent, "spent");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(reservation.id);
    if (it == reservations_.end()) {
        throw LedgerInvariantError("unknown or already settled reservation " + std::to_string(reservation.id));
    }
    if (spent > it->second.amount + LEDGER_EPSILON) {
        throw LedgerInvariantError("spent " + std::to_string(spent) + " exceeds reservation " +
                                   std::to_string(it->second.amount) + " " + it->second.currency);
    }

    Reservation held = take_reservation(reservation);
    Balance& balance = balance_for(held.currency);
    double spend = std::min(spent, held.amount);
    balance.locked = std::max(0.0, balance.locked - held.amount);
    balance.free += held.amount - spend;
}

void BalanceLedger::settle_receive(const std::string& currency, double amount) {
    check_amount(amount, "received");

    std::lock_guard<std::mutex> lock(mutex_);
    balance_for(currency).free += amount;
}

std::map<std::string, Balance> BalanceLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

Balance BalanceLedger::balance(const std::string& currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(currency);
    if (it == balances_.end()) {
        return Balance{currency, 0.0, 0.0};
    }
    return it->second;
}

double BalanceLedger::free(const std::string& currency) const {
    return balance(currency).free;
}

size_t BalanceLedger::outstanding_reservations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservations_.size();
}

Reservation BalanceLedger::take_reservation(const Reservation& reservation) {
    auto it = reservations_.find(reservation.id);
    if (it == reservations_.end()) {
        throw LedgerInvariantError("unknown or already settled reservation " + std::to_string(reservation.id));
    }
    Reservation held = it->second;
    reservations_.erase(it);
    return held;
}

Balance& BalanceLedger::balance_for(const std::string& currency) {
    auto it = balances_.find(currency);
    if (it == balances_.end()) {
        it = balances_.emplace(currency, Balance{currency, 0.0, 0.0}).first;
    }
    return it->second;
}

} // namespace xarb
