#include "config.h"
#include <nlohmann/json.hpp>
#include <fstream>

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Config file not found: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;

        Config cfg;
        cfg.store_path_ = j.at("store_path").get<std::string>();
        if (cfg.store_path_.empty()) throw ConfigError("store_path must not be empty");

        const auto secs = j.value("refresh_interval_secs", 5LL);
        if (secs <= 0) throw ConfigError("refresh_interval_secs must be positive");
        cfg.refresh_interval_ = std::chrono::seconds(secs);

        if (j.contains("max_refresh_cycles") && !j.at("max_refresh_cycles").is_null()) {
            const auto n = j.at("max_refresh_cycles").get<long long>();
            if (n < 0) throw ConfigError("max_refresh_cycles must not be negative");
            cfg.max_refresh_cycles_ = static_cast<std::size_t>(n);
        }

        const auto cap = j.value("queue_capacity", 64LL);
        if (cap <= 0) throw ConfigError("queue_capacity must be positive");
        cfg.queue_capacity_ = static_cast<std::size_t>(cap);

        const auto policy = j.value("bootstrap_policy", std::string("skip"));
        if (policy == "skip")        cfg.bootstrap_policy_ = BootstrapPolicy::Skip;
        else if (policy == "strict") cfg.bootstrap_policy_ = BootstrapPolicy::Strict;
        else throw ConfigError("bootstrap_policy must be \"skip\" or \"strict\"");

        cfg.log_level_ = parse_log_level(j.value("log_level", std::string("info")));
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Config " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Config " + path + ": " + e.what());
    }
}
