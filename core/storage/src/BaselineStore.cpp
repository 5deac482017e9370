#include "BaselineStore.h"
#include "Logger.h"
#include <filesystem>

namespace BehaviorSentinel {

    namespace {

        // Finalizes on scope exit.
        class Statement {
        public:
            Statement(sqlite3* db, const char* sql) {
                rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
            }
            ~Statement() {
                if (stmt_) sqlite3_finalize(stmt_);
            }
            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
            sqlite3_stmt* get() const { return stmt_; }

            void bindOptional(int index, const std::optional<double>& value) {
                if (value) {
                    sqlite3_bind_double(stmt_, index, *value);
                } else {
                    sqlite3_bind_null(stmt_, index);
                }
            }

        private:
            sqlite3_stmt* stmt_ = nullptr;
            int rc_ = SQLITE_ERROR;
        };

        std::optional<double> columnOptional(sqlite3_stmt* stmt, int col) {
            if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
                return std::nullopt;
            }
            return sqlite3_column_double(stmt, col);
        }

        std::string columnText(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : "";
        }

    }

    BaselineStore::~BaselineStore() {
        shutdown();
    }

    Result<void> BaselineStore::initialize(const std::string& dbPath) {
        auto& logger = Logger::instance();
        std::lock_guard<std::mutex> lock(mutex_);

        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        if (dbPath != ":memory:") {
            auto parent = std::filesystem::path(dbPath).parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    logger.log(LogLevel::ERROR, "Failed to create database directory: " + parent.string() +
                               " (" + ec.message() + ")", "BaselineStore");
                }
            }
        }

        logger.log(LogLevel::INFO, "Opening baseline store: " + dbPath, "BaselineStore");
        if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
            std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            logger.log(LogLevel::ERROR, "Cannot open database: " + message, "BaselineStore");
            return Err(ErrorCode::DatabaseOpenFailed, message);
        }

        if (dbPath != ":memory:") {
            auto wal = exec("PRAGMA journal_mode=WAL;");
            if (!wal) {
                logger.log(LogLevel::WARN, "Failed to enable WAL mode: " + wal.error().message, "BaselineStore");
            }
        }
        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

        int userVersion = 0;
        {
            Statement stmt(db_, "PRAGMA user_version;");
            if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
                userVersion = sqlite3_column_int(stmt.get(), 0);
            }
        }

        auto created = createTables();
        if (!created) {
            return created;
        }
        if (userVersion < SCHEMA_VERSION) {
            auto bumped = exec("PRAGMA user_version = 1;");
            if (!bumped) {
                logger.log(LogLevel::ERROR, "Failed to set user_version: " + bumped.error().message, "BaselineStore");
                return bumped;
            }
        }
        return Ok();
    }

    void BaselineStore::shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            Logger::instance().log(LogLevel::INFO, "Closing baseline store", "BaselineStore");
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool BaselineStore::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    // Caller holds mutex_.
    Result<void> BaselineStore::exec(const char* sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string message = errMsg ? errMsg : lastError();
            sqlite3_free(errMsg);
            return Err(ErrorCode::QueryFailed, message);
        }
        return Ok();
    }

    std::string BaselineStore::lastError() const {
        return db_ ? sqlite3_errmsg(db_) : "database not open";
    }

    Result<void> BaselineStore::createTables() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS agent_state ("
            "agent TEXT PRIMARY KEY,"
            "state TEXT NOT NULL,"
            "updated_at INTEGER);"

            "CREATE TABLE IF NOT EXISTS score_logs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "timestamp INTEGER NOT NULL,"
            "touch REAL,"
            "typing REAL,"
            "usage REAL,"
            "fused REAL NOT NULL,"
            "risk TEXT NOT NULL);"

            "CREATE INDEX IF NOT EXISTS idx_score_logs_timestamp ON score_logs(timestamp);";

        auto result = exec(sql);
        if (!result) {
            Logger::instance().log(LogLevel::ERROR, "Failed to create tables: " + result.error().message, "BaselineStore");
            return Err(ErrorCode::DatabaseError, result.error().message);
        }
        return Ok();
    }

    Result<void> BaselineStore::saveState(const std::string& agent, const std::string& encoded, int64_t updatedAtMs) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return Err(ErrorCode::DatabaseError, "database not open");

        Statement stmt(db_,
            "INSERT OR REPLACE INTO agent_state (agent, state, updated_at) VALUES (?, ?, ?);");
        if (!stmt.ok()) return Err(ErrorCode::QueryFailed, lastError());

        sqlite3_bind_text(stmt.get(), 1, agent.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, encoded.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 3, updatedAtMs);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return Err(ErrorCode::QueryFailed, lastError());
        }
        return Ok();
    }

    Result<std::string> BaselineStore::loadState(const std::string& agent) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return Err<std::string>(ErrorCode::DatabaseError, "database not open");

        Statement stmt(db_, "SELECT state FROM agent_state WHERE agent = ?;");
        if (!stmt.ok()) return Err<std::string>(ErrorCode::QueryFailed, lastError());
        sqlite3_bind_text(stmt.get(), 1, agent.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            return columnText(stmt.get(), 0);
        }
        if (rc == SQLITE_DONE) {
            return Err<std::string>(ErrorCode::NotFound, "no stored state for " + agent);
        }
        return Err<std::string>(ErrorCode::QueryFailed, lastError());
    }

    Result<void> BaselineStore::appendScoreLog(const ScoreLogEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return Err(ErrorCode::DatabaseError, "database not open");

        Statement stmt(db_,
            "INSERT INTO score_logs (timestamp, touch, typing, usage, fused, risk) VALUES (?, ?, ?, ?, ?, ?);");
        if (!stmt.ok()) return Err(ErrorCode::QueryFailed, lastError());

        sqlite3_bind_int64(stmt.get(), 1, entry.timestampMs);
        stmt.bindOptional(2, entry.touch);
        stmt.bindOptional(3, entry.typing);
        stmt.bindOptional(4, entry.usage);
        sqlite3_bind_double(stmt.get(), 5, entry.fused);
        sqlite3_bind_text(stmt.get(), 6, entry.risk.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return Err(ErrorCode::QueryFailed, lastError());
        }
        return Ok();
    }

    Result<std::vector<ScoreLogEntry>> BaselineStore::recentScoreLogs(size_t limit) const {
        using Entries = std::vector<ScoreLogEntry>;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return Err<Entries>(ErrorCode::DatabaseError, "database not open");

        Statement stmt(db_,
            "SELECT id, timestamp, touch, typing, usage, fused, risk FROM score_logs "
            "ORDER BY timestamp DESC, id DESC LIMIT ?;");
        if (!stmt.ok()) return Err<Entries>(ErrorCode::QueryFailed, lastError());
        sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

        Entries entries;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            ScoreLogEntry e;
            e.id = sqlite3_column_int64(stmt.get(), 0);
            e.timestampMs = sqlite3_column_int64(stmt.get(), 1);
            e.touch = columnOptional(stmt.get(), 2);
            e.typing = columnOptional(stmt.get(), 3);
            e.usage = columnOptional(stmt.get(), 4);
            e.fused = sqlite3_column_double(stmt.get(), 5);
            e.risk = columnText(stmt.get(), 6);
            entries.push_back(std::move(e));
        }
        if (rc != SQLITE_DONE) {
            return Err<Entries>(ErrorCode::QueryFailed, lastError());
        }
        return entries;
    }

}
