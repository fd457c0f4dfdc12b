// include/display_service.h
#pragma once
#include "entry_registry.h"
#include "event_queue.h"
#include "event_reducer.h"
#include "refresh_scheduler.h"
#include "snapshot_publisher.h"
#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

class Logger;
class OtpUriParser;
class OtpUriStore;
class PasswordGeneratorFactory;

// Owns the event pipeline: scheduler and delete triggers feed one queue,
// a single reducer thread folds it into snapshots, every snapshot is
// published.
class OtpDisplayService {
public:
    struct Options {
        RefreshScheduler::Options refresh;
        std::size_t queue_capacity = 64;
        BootstrapPolicy bootstrap_policy = BootstrapPolicy::Skip;
    };

    // Borrow existing instances; no ownership.
    OtpDisplayService(OtpUriStore& store,
                      const OtpUriParser& parser,
                      const PasswordGeneratorFactory& factory,
                      Logger& log,
                      Options opts);
    ~OtpDisplayService();

    OtpDisplayService(const OtpDisplayService&) = delete;
    OtpDisplayService& operator=(const OtpDisplayService&) = delete;

    // Bootstrap, publish the seed view, spawn the reducer, start ticking.
    // Throws BootstrapError under BootstrapPolicy::Strict. Returns false if
    // the service was already stopped once.
    bool start();

    // Stop ticking, close the queue, drain what is queued, join.
    void stop();

    // Queue an event from any thread. Throws QueueClosedError after stop().
    void submit(OtpEvent ev);

    SnapshotPublisher& publisher() noexcept { return publisher_; }
    const RefreshScheduler& scheduler() const noexcept { return scheduler_; }
    Snapshot snapshot() const { return registry_.current(); }
    const std::vector<BootstrapFailure>& bootstrap_failures() const noexcept { return failures_; }

    // Events fully applied and published since start().
    std::size_t processed() const noexcept { return processed_.load(); }
    bool running() const noexcept { return running_.load(); }

private:
    void run();

    Logger& log_;
    Options opts_;

    std::shared_ptr<EventQueue> q_;   // display items only hold a weak_ptr to it
    EntryRegistry registry_;
    EventReducer reducer_;
    SnapshotPublisher publisher_;
    RefreshScheduler scheduler_;

    std::vector<BootstrapFailure> failures_;
    std::atomic<std::size_t> processed_{0};
    std::atomic<bool> running_{false};
    std::thread thr_;
};
