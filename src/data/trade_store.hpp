#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../core/types.hpp"

namespace xarb {

// Durable record of terminal attempts, balance snapshots and the opportunity
// log. Attempt records are append-only; reconciliation is tracked beside the
// record, never by rewriting it. Implementations throw DatabaseError.
class TradeStore {
public:
    virtual ~TradeStore() = default;

    virtual void save_attempt(const TradeAttempt& attempt) = 0;
    virtual void save_balance_snapshot(const std::map<std::string, Balance>& balances, Timestamp taken_at) = 0;
    virtual std::optional<std::map<std::string, Balance>> load_latest_balances() = 0;
    virtual void record_opportunity(const OpportunityRecord& record) = 0;

    // Asset sold by attempts finished at or after `since`.
    virtual double volume_traded_since(Timestamp since) = 0;
    virtual double realized_pnl_since(Timestamp since) = 0;
    // Completed share of the last `window` terminal attempts; 1.0 when there are none.
    virtual double recent_success_rate(size_t window) = 0;
    virtual std::optional<Timestamp> last_attempt_finished_at() = 0;

    virtual std::vector<TradeAttempt> recent_attempts(size_t limit) = 0;
    virtual TradeStatistics statistics(Timestamp day_start) = 0;

    virtual std::vector<std::string> unresolved_attempt_ids() = 0;
    virtual void mark_reconciled(const std::string& attempt_id) = 0;
};

} // namespace xarb
