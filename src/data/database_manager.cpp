#include "database_manager.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"

namespace xarb {

namespace {

// Prepared statement that finalizes itself on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db), stmt_(nullptr) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw DatabaseError(std::string("failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int index, double value) { sqlite3_bind_double(stmt_, index, value); }
    void bind(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }
    void bind(int index, int value) { sqlite3_bind_int(stmt_, index, value); }

    // True while rows remain.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw DatabaseError(std::string("failed to execute statement: ") + sqlite3_errmsg(db_));
    }

    bool is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }
    double column_double(int column) const { return sqlite3_column_double(stmt_, column); }
    int64_t column_int64(int column) const { return sqlite3_column_int64(stmt_, column); }
    std::string column_text(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

} // namespace

DatabaseManager::DatabaseManager(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        XARB_LOG_ERROR("Can't open database {}: {}", db_path_, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    try {
        exec("CREATE TABLE IF NOT EXISTS trade_attempts("
             "id TEXT PRIMARY KEY NOT NULL,"
             "detected_at INTEGER NOT NULL,"
             "finished_at INTEGER NOT NULL,"
             "sell_market TEXT NOT NULL,"
             "buy_market TEXT NOT NULL,"
             "status TEXT NOT NULL,"
             "sold_amount REAL NOT NULL,"
             "realized_pnl REAL NOT NULL,"
             "requires_reconciliation INTEGER NOT NULL,"
             "reconciled INTEGER NOT NULL DEFAULT 0,"
             "body TEXT NOT NULL);");
        exec("CREATE INDEX IF NOT EXISTS idx_trade_attempts_finished_at ON trade_attempts(finished_at);");
        exec("CREATE TABLE IF NOT EXISTS balance_snapshots("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "taken_at INTEGER NOT NULL,"
             "body TEXT NOT NULL);");
        exec("CREATE TABLE IF NOT EXISTS opportunities("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "detected_at INTEGER NOT NULL,"
             "sell_market TEXT NOT NULL,"
             "buy_market TEXT NOT NULL,"
             "sell_price REAL NOT NULL,"
             "buy_price REAL NOT NULL,"
             "spread_percentage REAL NOT NULL,"
             "requested_amount REAL NOT NULL,"
             "approved INTEGER NOT NULL,"
             "reason TEXT NOT NULL);");
    } catch (const DatabaseError& e) {
        XARB_LOG_ERROR("Failed to create schema in {}: {}", db_path_, e.what());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    XARB_LOG_INFO("Opened database {}", db_path_);
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void DatabaseManager::require_open() const {
    if (!db_) {
        throw DatabaseError("database " + db_path_ + " is not open");
    }
}

void DatabaseManager::exec(const char* sql) {
    char* error_message = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_message) != SQLITE_OK) {
        std::string message = error_message ? error_message : "unknown error";
        sqlite3_free(error_message);
        throw DatabaseError("SQL error: " + message);
    }
}

void DatabaseManager::save_attempt(const TradeAttempt& attempt) {
    if (!is_terminal(attempt.state) || !attempt.finished_at) {
        throw DatabaseError("attempt " + attempt.id + " is not terminal");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "INSERT INTO trade_attempts (id,detected_at,finished_at,sell_market,buy_market,status,"
                        "sold_amount,realized_pnl,requires_reconciliation,body) VALUES (?,?,?,?,?,?,?,?,?,?);");
    stmt.bind(1, attempt.id);
    stmt.bind(2, to_epoch_ms(attempt.detected_at));
    stmt.bind(3, to_epoch_ms(*attempt.finished_at));
    stmt.bind(4, to_string(attempt.sell_market));
    stmt.bind(5, to_string(attempt.buy_market));
    stmt.bind(6, to_string(attempt.status));
    stmt.bind(7, attempt.sell_leg.filled_amount);
    stmt.bind(8, attempt.realized_profit_loss);
    stmt.bind(9, attempt.requires_reconciliation ? 1 : 0);
    stmt.bind(10, nlohmann::json(attempt).dump());
    stmt.step();
}

void DatabaseManager::save_balance_snapshot(const std::map<std::string, Balance>& balances, Timestamp taken_at) {
    nlohmann::json body = nlohmann::json::array();
    for (const auto& [currency, balance] : balances) {
        body.push_back(balance);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "INSERT INTO balance_snapshots (taken_at,body) VALUES (?,?);");
    stmt.bind(1, to_epoch_ms(taken_at));
    stmt.bind(2, body.dump());
    stmt.step();
}

std::optional<std::map<std::string, Balance>> DatabaseManager::load_latest_balances() {
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        Statement stmt(db_, "SELECT body FROM balance_snapshots ORDER BY id DESC LIMIT 1;");
        if (!stmt.step()) {
            return std::nullopt;
        }
        body = stmt.column_text(0);
    }

    try {
        std::map<std::string, Balance> balances;
        for (const auto& item : nlohmann::json::parse(body)) {
            Balance balance = item.get<Balance>();
            balances[balance.currency] = balance;
        }
        return balances;
    } catch (const nlohmann::json::exception& e) {
        throw DatabaseError(std::string("corrupt balance snapshot: ") + e.what());
    }
}

void DatabaseManager::record_opportunity(const OpportunityRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "INSERT INTO opportunities (detected_at,sell_market,buy_market,sell_price,buy_price,"
                        "spread_percentage,requested_amount,approved,reason) VALUES (?,?,?,?,?,?,?,?,?);");
    stmt.bind(1, to_epoch_ms(record.detected_at));
    stmt.bind(2, to_string(record.sell_market));
    stmt.bind(3, to_string(record.buy_market));
    stmt.bind(4, record.sell_price);
    stmt.bind(5, record.buy_price);
    stmt.bind(6, record.spread_percentage);
    stmt.bind(7, record.requested_amount);
    stmt.bind(8, record.approved ? 1 : 0);
    stmt.bind(9, to_string(record.reason));
    stmt.step();
}

size_t DatabaseManager::opportunity_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT COUNT(*) FROM opportunities;");
    stmt.step();
    return static_cast<size_t>(stmt.column_int64(0));
}

double DatabaseManager::sum_since(const char* column, Timestamp since) {
    std::string sql = std::string("SELECT COALESCE(SUM(") + column + "),0) FROM trade_attempts WHERE finished_at >= ?;";
    Statement stmt(db_, sql.c_str());
    stmt.bind(1, to_epoch_ms(since));
    stmt.step();
    return stmt.column_double(0);
}

double DatabaseManager::volume_traded_since(Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return sum_since("sold_amount", since);
}

double DatabaseManager::realized_pnl_since(Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return sum_since("realized_pnl", since);
}

double DatabaseManager::recent_success_rate(size_t window) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT status FROM trade_attempts ORDER BY finished_at DESC, rowid DESC LIMIT ?;");
    stmt.bind(1, static_cast<int64_t>(window));
    size_t total = 0;
    size_t completed = 0;
    while (stmt.step()) {
        ++total;
        if (stmt.column_text(0) == to_string(AttemptStatus::COMPLETED)) {
            ++completed;
        }
    }
    return total == 0 ? 1.0 : static_cast<double>(completed) / total;
}

std::optional<Timestamp> DatabaseManager::last_attempt_finished_at() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT MAX(finished_at) FROM trade_attempts;");
    stmt.step();
    if (stmt.is_null(0)) {
        return std::nullopt;
    }
    return from_epoch_ms(stmt.column_int64(0));
}

std::vector<TradeAttempt> DatabaseManager::recent_attempts(size_t limit) {
    std::vector<std::string> bodies;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        Statement stmt(db_, "SELECT body FROM trade_attempts ORDER BY finished_at DESC, rowid DESC LIMIT ?;");
        stmt.bind(1, static_cast<int64_t>(limit));
        while (stmt.step()) {
            bodies.push_back(stmt.column_text(0));
        }
    }

    std::vector<TradeAttempt> attempts;
    attempts.reserve(bodies.size());
    try {
        for (const auto& body : bodies) {
            attempts.push_back(nlohmann::json::parse(body).get<TradeAttempt>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw DatabaseError(std::string("corrupt attempt record: ") + e.what());
    }
    return attempts;
}

TradeStatistics DatabaseManager::statistics(Timestamp day_start) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    TradeStatistics stats;
    Statement stmt(db_, "SELECT status, COUNT(*), COALESCE(SUM(realized_pnl),0) FROM trade_attempts GROUP BY status;");
    while (stmt.step()) {
        std::string status = stmt.column_text(0);
        int count = static_cast<int>(stmt.column_int64(1));
        stats.total_attempts += count;
        stats.realized_pnl += stmt.column_double(2);
        if (status == to_string(AttemptStatus::COMPLETED)) {
            stats.completed = count;
        } else if (status == to_string(AttemptStatus::ABORTED)) {
            stats.aborted = count;
        } else if (status == to_string(AttemptStatus::PARTIAL)) {
            stats.partial = count;
        }
    }
    stats.success_rate = stats.total_attempts == 0
        ? 0.0 : static_cast<double>(stats.completed) / stats.total_attempts;
    stats.volume_today = sum_since("sold_amount", day_start);
    stats.realized_pnl_today = sum_since("realized_pnl", day_start);
    return stats;
}

std::vector<std::string> DatabaseManager::unresolved_attempt_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT id FROM trade_attempts WHERE status = ? AND reconciled = 0 ORDER BY finished_at;");
    stmt.bind(1, to_string(AttemptStatus::PARTIAL));
    std::vector<std::string> ids;
    while (stmt.step()) {
        ids.push_back(stmt.column_text(0));
    }
    return ids;
}

void DatabaseManager::mark_reconciled(const std::string& attempt_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "UPDATE trade_attempts SET reconciled = 1 WHERE id = ?;");
    stmt.bind(1, attempt_id);
    stmt.step();
    if (sqlite3_changes(db_) == 0) {
        throw DatabaseError("no attempt with id " + attempt_id);
    }
}

} // namespace xarb
