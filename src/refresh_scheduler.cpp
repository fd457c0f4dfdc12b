#include "refresh_scheduler.h"
#include "event_queue.h"
#include "logger.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <utility>

namespace asio = boost::asio;

struct RefreshScheduler::Impl {
    EventQueue& q;
    Logger& log;
    const Options& opts;

    asio::io_context ioc;
    asio::steady_timer timer{ioc};
    std::thread io_thread;

    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> finished{false};
    std::atomic<std::size_t> ticks{0};

    Impl(EventQueue& q_, Logger& l, const Options& o) : q(q_), log(l), opts(o) {}

    bool limit_reached() const {
        return opts.max_ticks && ticks.load() >= *opts.max_ticks;
    }

    void arm() {
        timer.expires_after(opts.interval);
        timer.async_wait([this](const boost::system::error_code& ec) { on_tick(ec); });
    }

    void on_tick(const boost::system::error_code& ec) {
        if (ec || stopping.load()) return; // cancelled by stop()
        try {
            q.push(RegenerateEvent{});
        } catch (const QueueClosedError& e) {
            log.warn(std::string("[refresh] tick dropped, scheduler halting: ") + e.what());
            return;
        }
        ticks.fetch_add(1);
        log.trace("[refresh] tick " + std::to_string(ticks.load()));
        if (limit_reached()) {
            finished.store(true);
            log.info("[refresh] reached " + std::to_string(ticks.load()) + " ticks, stopping");
            return;
        }
        arm();
    }
};

// ---- public API ----

RefreshScheduler::RefreshScheduler(EventQueue& q, Logger& log)
    : RefreshScheduler(q, log, Options{}) {}

RefreshScheduler::RefreshScheduler(EventQueue& q, Logger& log, Options opts)
    : impl_(nullptr), opts_(std::move(opts)) {
    impl_ = new Impl(q, log, opts_);
}

RefreshScheduler::~RefreshScheduler() {
    stop();
    delete impl_;
}

bool RefreshScheduler::start() {
    if (impl_->running.exchange(true)) return true;
    impl_->stopping.store(false);
    impl_->ioc.restart();
    impl_->ioc.poll();    // flush a cancel left over from an earlier stop()
    impl_->ioc.restart();
    if (impl_->limit_reached()) {
        impl_->finished.store(true);
    } else {
        impl_->arm();
    }
    impl_->io_thread = std::thread([this] { impl_->ioc.run(); });
    return true;
}

void RefreshScheduler::stop() {
    if (!impl_->running.exchange(false)) return;
    impl_->stopping.store(true);
    // cancel on the timer's own thread; a tick already pushing completes first
    asio::post(impl_->ioc, [this] { impl_->timer.cancel(); });
    if (impl_->io_thread.joinable()) impl_->io_thread.join();
}

bool RefreshScheduler::running() const noexcept {
    return impl_->running.load();
}

bool RefreshScheduler::finished() const noexcept {
    return impl_->finished.load();
}

std::size_t RefreshScheduler::ticks_emitted() const noexcept {
    return impl_->ticks.load();
}
