#pragma once

#include "Result.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <cstddef>

namespace BehaviorSentinel {

    /**
     * @brief Thread-safe key=value settings store
     *
     * File format: one `key = value` per line, `#` starts a comment line.
     * Keys used by the engine are listed in config/behavior_sentinel.conf.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        Result<void> loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        Result<void> saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        double getDouble(const std::string& key, double defaultValue = 0.0) const;
        void setDouble(const std::string& key, double value);

        /**
         * @brief Run validators against the keys that are present
         * @return Error naming the first rejected key
         */
        Result<void> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
    };

    /**
     * @brief Validate the engine keys (warmups, windows, weights, intervals)
     */
    Result<void> validateConfig(const Config& config);

}
