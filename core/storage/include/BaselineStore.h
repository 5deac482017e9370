#pragma once

#include "Result.h"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief One fused verdict as persisted in score_logs
     */
    struct ScoreLogEntry {
        int64_t id{0};
        int64_t timestampMs{0};
        std::optional<double> touch;
        std::optional<double> typing;
        std::optional<double> usage;
        double fused{0.0};
        std::string risk;
    };

    /**
     * @brief SQLite store for opaque agent state records and score history
     *
     * Tables:
     *   agent_state(agent TEXT PRIMARY KEY, state TEXT, updated_at INTEGER)
     *   score_logs(id, timestamp, touch, typing, usage, fused, risk)
     */
    class BaselineStore {
    public:
        static constexpr int SCHEMA_VERSION = 1;
        static constexpr int BUSY_TIMEOUT_MS = 5000;

        BaselineStore() = default;
        ~BaselineStore();

        BaselineStore(const BaselineStore&) = delete;
        BaselineStore& operator=(const BaselineStore&) = delete;

        /**
         * @brief Open (or create) the database; ":memory:" is accepted
         */
        Result<void> initialize(const std::string& dbPath);
        void shutdown();
        bool isOpen() const;

        Result<void> saveState(const std::string& agent, const std::string& encoded, int64_t updatedAtMs = 0);

        /**
         * @return NotFound when no record exists for agent
         */
        Result<std::string> loadState(const std::string& agent) const;

        Result<void> appendScoreLog(const ScoreLogEntry& entry);

        /**
         * @brief Newest first
         */
        Result<std::vector<ScoreLogEntry>> recentScoreLogs(size_t limit) const;

    private:
        Result<void> createTables();
        Result<void> exec(const char* sql);
        std::string lastError() const;

        mutable std::mutex mutex_;
        sqlite3* db_ = nullptr;
    };

}
