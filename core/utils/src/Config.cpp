#include "Config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace BehaviorSentinel {

    Config& Config::instance() {
        static Config instance;
        return instance;
    }

    Result<void> Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err(ErrorCode::ConfigError, "cannot open config file: " + path);
        }

        std::vector<std::pair<std::string, std::string>> parsed;
        std::string line;
        while (std::getline(file, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            size_t eq = trimmed.find('=');
            if (eq == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, eq));
            std::string value = trim(trimmed.substr(eq + 1));
            if (!key.empty()) {
                parsed.emplace_back(key, value);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : parsed) {
            if (overrideExisting || settings_.find(key) == settings_.end()) {
                settings_[key] = value;
            }
        }
        return Ok();
    }

    bool Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        bool loaded = false;
        for (const auto& path : paths) {
            if (loadFromFile(path, overrideExisting)) {
                loaded = true;
            }
        }
        return loaded;
    }

    Result<void> Config::saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream file(path);
        if (!file.is_open()) {
            return Err(ErrorCode::FileWriteError, "cannot write config file: " + path);
        }
        for (const auto& [key, value] : settings_) {
            file << key << " = " << value << '\n';
        }
        return Ok();
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.find(key) != settings_.end();
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string val = get(key);
        if (val.empty()) return defaultValue;
        try {
            return std::stoi(val);
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key);
        if (val.empty() || val[0] == '-') return defaultValue;
        try {
            return static_cast<size_t>(std::stoull(val));
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string val = get(key);
        if (val.empty()) return defaultValue;
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
        if (val == "0" || val == "false" || val == "no" || val == "off") return false;
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    double Config::getDouble(const std::string& key, double defaultValue) const {
        std::string val = get(key);
        if (val.empty()) return defaultValue;
        try {
            return std::stod(val);
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setDouble(const std::string& key, double value) {
        std::ostringstream ss;
        ss << value;
        set(key, ss.str());
    }

    Result<void> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(key, it->second)) {
                return Err(ErrorCode::ConfigError, "invalid value for " + key + ": " + it->second);
            }
        }
        return Ok();
    }

    std::string Config::trim(const std::string& value) {
        auto begin = std::find_if_not(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(),
                                    [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    namespace {

        bool isPositiveInteger(const std::string&, const std::string& value) {
            try {
                size_t consumed = 0;
                long long parsed = std::stoll(value, &consumed);
                return consumed == value.size() && parsed > 0;
            } catch (const std::exception&) {
                return false;
            }
        }

        bool isNonNegativeNumber(const std::string&, const std::string& value) {
            try {
                size_t consumed = 0;
                double parsed = std::stod(value, &consumed);
                return consumed == value.size() && parsed >= 0.0;
            } catch (const std::exception&) {
                return false;
            }
        }

    }

    Result<void> validateConfig(const Config& config) {
        std::unordered_map<std::string, Config::Validator> schema{
            {"touch.warmup_gestures", isPositiveInteger},
            {"touch.window_size", isPositiveInteger},
            {"typing.warmup_keystrokes", isPositiveInteger},
            {"typing.window_size", isPositiveInteger},
            {"typing.event_window_size", isPositiveInteger},
            {"usage.warmup_sessions", isPositiveInteger},
            {"usage.rate_window_ms", isPositiveInteger},
            {"usage.duration_window_size", isPositiveInteger},
            {"fusion.weight.touch", isNonNegativeNumber},
            {"fusion.weight.typing", isNonNegativeNumber},
            {"fusion.weight.usage", isNonNegativeNumber},
            {"response.min_alert_interval_ms", isNonNegativeNumber},
            {"response.min_score_delta", isNonNegativeNumber},
        };
        return config.validate(schema);
    }

}
