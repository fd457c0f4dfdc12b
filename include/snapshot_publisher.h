// include/snapshot_publisher.h
#pragma once
#include "otp_entry.h"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class EventQueue;
class Logger;

// Read-only projection of one entry. on_delete() queues a DeleteEvent for the
// exact entry value this item was derived from; it may block while the queue
// is full. Items may outlive the service: once the queue is closed or gone,
// on_delete() throws QueueClosedError.
struct DisplayItem {
    std::string code;
    std::string account;
    std::optional<std::string> issuer;
    std::function<void()> on_delete;
};

using DisplayItems = std::vector<DisplayItem>;

class SnapshotPublisher {
public:
    using Subscriber = std::function<void(const DisplayItems&)>;
    using Token = std::size_t;

    SnapshotPublisher(std::weak_ptr<EventQueue> q, Logger& log);

    SnapshotPublisher(const SnapshotPublisher&) = delete;
    SnapshotPublisher& operator=(const SnapshotPublisher&) = delete;

    // New subscribers immediately receive the latest view, if any.
    // Callbacks run on the publishing thread and must not call on_delete()
    // synchronously (the reducer would wait on itself once the queue fills).
    // They may subscribe() or unsubscribe(); a subscriber added from inside a
    // callback gets the replay at once and joins from the next publish().
    Token subscribe(Subscriber fn);
    void unsubscribe(Token t);

    // Entry-by-entry projection, same order. Pure.
    DisplayItems project(const Snapshot& s) const;

    // project() + deliver to every subscriber; returns the delivered view.
    DisplayItems publish(const Snapshot& s);

    std::optional<DisplayItems> latest() const;
    std::size_t publications() const;

private:
    std::weak_ptr<EventQueue> q_;
    Logger& log_;

    mutable std::mutex mu_;                 // subscribers_, latest_, next_token_, count_
    std::recursive_mutex deliver_mu_;       // keeps deliveries in publish order; re-entered from callbacks
    std::map<Token, Subscriber> subscribers_;
    std::optional<DisplayItems> latest_;
    Token next_token_ = 1;
    std::size_t count_ = 0;

    void deliver(const Subscriber& fn, const DisplayItems& view);
};
