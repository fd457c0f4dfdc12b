// include/refresh_scheduler.h
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

class EventQueue;
class Logger;

// Pushes one RegenerateEvent into the queue per tick. Ticks never overlap:
// the timer is re-armed only after the previous event was queued.
class RefreshScheduler {
public:
    struct Options {
        std::chrono::milliseconds interval{std::chrono::seconds(5)};
        std::optional<std::size_t> max_ticks;   // unset: run until stop()
    };

    RefreshScheduler(EventQueue& q, Logger& log);
    RefreshScheduler(EventQueue& q, Logger& log, Options opts);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    bool start();     // spawn timer thread
    void stop();      // cancel pending tick + join; queued events are untouched

    // Started and not yet stopped. A bounded run that emitted its last tick
    // is finished() but still running() until stop().
    bool running() const noexcept;
    bool finished() const noexcept;           // bounded run emitted all its ticks
    std::size_t ticks_emitted() const noexcept;
    const Options& options() const noexcept { return opts_; }

private:
    struct Impl;        // pimpl to keep Boost.Asio out of headers
    Impl* impl_;
    Options opts_;
};
