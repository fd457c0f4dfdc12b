#pragma once
#include "entry_registry.h"
#include "logger.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Config {
public:
    // Load settings from json file; throws ConfigError
    static Config load_from_file(const std::string& path);

    // Accessors (read-only)
    const std::string& store_path() const {return store_path_; }
    std::chrono::seconds refresh_interval() const {return refresh_interval_; }
    const std::optional<std::size_t>& max_refresh_cycles() const {return max_refresh_cycles_; }
    std::size_t queue_capacity() const {return queue_capacity_; }
    BootstrapPolicy bootstrap_policy() const {return bootstrap_policy_; }
    LogLevel log_level() const {return log_level_; }

private:
    // private ctor enforce factory method
    Config() = default;

    std::string store_path_;
    std::chrono::seconds refresh_interval_{5};
    std::optional<std::size_t> max_refresh_cycles_;     // unset: refresh forever
    std::size_t queue_capacity_ = 64;
    BootstrapPolicy bootstrap_policy_ = BootstrapPolicy::Skip;
    LogLevel log_level_ = LogLevel::INFO;
};
