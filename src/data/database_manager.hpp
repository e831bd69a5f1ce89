#pragma once

#include <mutex>
#include <string>
#include "trade_store.hpp"

struct sqlite3;

namespace xarb {

// SQLite3 TradeStore. ":memory:" gives a private in-process database.
class DatabaseManager : public TradeStore {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool open();
    void close();
    bool is_open() const;

    void save_attempt(const TradeAttempt& attempt) override;
    void save_balance_snapshot(const std::map<std::string, Balance>& balances, Timestamp taken_at) override;
    std::optional<std::map<std::string, Balance>> load_latest_balances() override;
    void record_opportunity(const OpportunityRecord& record) override;

    double volume_traded_since(Timestamp since) override;
    double realized_pnl_since(Timestamp since) override;
    double recent_success_rate(size_t window) override;
    std::optional<Timestamp> last_attempt_finished_at() override;

    std::vector<TradeAttempt> recent_attempts(size_t limit) override;
    TradeStatistics statistics(Timestamp day_start) override;

    std::vector<std::string> unresolved_attempt_ids() override;
    void mark_reconciled(const std::string& attempt_id) override;

    size_t opportunity_count();

private:
    void require_open() const;
    void exec(const char* sql);
    double sum_since(const char* column, Timestamp since);

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

} // namespace xarb
