#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

LogLevel parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (n == "trace") return LogLevel::TRACE;
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info")  return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

const char* log_level_name(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::string name, std::ostream& out)
  : name_(std::move(name)),
    level_(LogLevel::INFO),
    out_(&out),
    mutex_(std::make_unique<std::mutex>())
{}

Logger::Logger(Logger&& other) noexcept
  : name_(std::move(other.name_)),
    level_(other.level_.load()),
    out_(other.out_),
    mutex_(std::move(other.mutex_))
{}

Logger& Logger::operator=(Logger&& other) noexcept {
    if (this == &other) return *this;
    std::unique_ptr<std::mutex> old; // outlives the guards below
    {
        std::lock_guard<std::mutex> l1(*mutex_);
        std::lock_guard<std::mutex> l2(*other.mutex_);
        name_ = std::move(other.name_);
        level_ = other.level_.load();
        out_ = other.out_;
        old = std::move(mutex_);
        mutex_ = std::move(other.mutex_);
    }
    return *this;
}

void Logger::set_level(LogLevel level) noexcept {
    level_.store(level);
}

LogLevel Logger::level() const noexcept {
    return level_.load();
}

bool Logger::enabled(LogLevel lvl) const noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level_.load());
}

void Logger::emit(LogLevel lvl, const std::string& payload) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream header;
    header << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << ms.count()
           << " [" << log_level_name(lvl) << "] " << name_ << ": ";

    std::lock_guard<std::mutex> lk(*mutex_);
    (*out_) << header.str() << payload << '\n';
    out_->flush();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    emit(lvl, msg);
}

void Logger::trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }
