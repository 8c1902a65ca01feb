#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace lineage {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Defaults, then LINEAGE_* environment variables, then the optional file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_defaults();
        load_from_env();

        if (!config_file.empty()) {
            if (std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            } else {
                LOG_WARN("Config file not found: ", config_file);
            }
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    // Drop every value and restore built-in defaults (no environment)
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
        load_defaults();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::map<std::string, std::string> sorted(values_.begin(), values_.end());
        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : sorted) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() { load_defaults(); }
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_defaults() {
        values_["corpus.extensions"] = ".py,.sql,.sas";
        values_["budget.max_paths"] = "100000";
        values_["budget.max_depth"] = "64";
        values_["budget.time_ms"] = "0";      // 0 = no wall-clock budget
        values_["perf.max_threads"] = "0";    // 0 = auto-detect
        values_["writers.policy"] = "union";
        values_["log.level"] = "info";
        values_["log.file"] = "";
        values_["output.path"] = "lineage.csv";
    }

    void load_from_env() {
        set_if_env("corpus.extensions", "LINEAGE_EXTENSIONS");
        set_if_env("budget.max_paths", "LINEAGE_MAX_PATHS");
        set_if_env("budget.max_depth", "LINEAGE_MAX_DEPTH");
        set_if_env("budget.time_ms", "LINEAGE_TIME_BUDGET_MS");
        set_if_env("perf.max_threads", "LINEAGE_MAX_THREADS");
        set_if_env("writers.policy", "LINEAGE_WRITER_POLICY");
        set_if_env("log.level", "LINEAGE_LOG_LEVEL");
        set_if_env("log.file", "LINEAGE_LOG_FILE");
        set_if_env("output.path", "LINEAGE_OUTPUT");
    }

    void set_if_env(const std::string& key, const char* env_var) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), [](int ch) { return !std::isspace(ch); }));
                key.erase(std::find_if(key.rbegin(), key.rend(), [](int ch) { return !std::isspace(ch); }).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](int ch) { return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](int ch) { return !std::isspace(ch); }).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Called with mutex_ held
    bool validate() {
        bool valid = true;

        auto at_least = [&](const char* key, long long minimum) {
            auto it = values_.find(key);
            if (it == values_.end()) return;
            try {
                if (std::stoll(it->second) < minimum) {
                    LOG_ERROR("Config value for '", key, "' must be at least ", minimum, ": ", it->second);
                    valid = false;
                }
            } catch (const std::exception&) {
                LOG_ERROR("Config value for '", key, "' is not a number: ", it->second);
                valid = false;
            }
        };
        auto non_negative = [&](const char* key) { at_least(key, 0); };

        // Path enumeration always runs with a finite budget
        at_least("budget.max_paths", 1);
        at_least("budget.max_depth", 1);
        non_negative("budget.time_ms");
        non_negative("perf.max_threads");

        std::string& policy = values_["writers.policy"];
        policy.erase(policy.begin(), std::find_if(policy.begin(), policy.end(), [](int ch) { return !std::isspace(ch); }));
        policy.erase(std::find_if(policy.rbegin(), policy.rend(), [](int ch) { return !std::isspace(ch); }).base(), policy.end());
        std::transform(policy.begin(), policy.end(), policy.begin(), ::tolower);
        if (policy != "union" && policy != "intersection") {
            LOG_ERROR("Unknown writer merge policy '", policy, "' (expected union or intersection)");
            valid = false;
        }

        if (!parse_log_level(values_["log.level"])) {
            LOG_WARN("Unknown log level '", values_["log.level"], "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply the logging settings it carries
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (auto level = parse_log_level(config.get<std::string>("log.level"))) {
        set_log_level(*level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded successfully");
    return true;
}

} // namespace lineage
