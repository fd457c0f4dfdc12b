#include "snapshot_publisher.h"
#include "event_queue.h"
#include "logger.h"

#include <exception>
#include <utility>

SnapshotPublisher::SnapshotPublisher(std::weak_ptr<EventQueue> q, Logger& log)
    : q_(std::move(q)), log_(log) {}

DisplayItems SnapshotPublisher::project(const Snapshot& s) const {
    DisplayItems out;
    out.reserve(s->size());
    const std::weak_ptr<EventQueue> q = q_;
    for (const auto& e : *s) {
        DisplayItem item;
        item.code = e.code;
        item.account = e.account;
        item.issuer = e.issuer;
        // bound by value: positions shift after deletions
        item.on_delete = [q, e] {
            auto live = q.lock();
            if (!live) throw QueueClosedError();
            live->push(DeleteEvent{e});
        };
        out.push_back(std::move(item));
    }
    return out;
}

void SnapshotPublisher::deliver(const Subscriber& fn, const DisplayItems& view) {
    try {
        fn(view);
    } catch (const std::exception& e) {
        log_.error(std::string("[publish] subscriber threw: ") + e.what());
    }
}

DisplayItems SnapshotPublisher::publish(const Snapshot& s) {
    DisplayItems view = project(s);

    std::lock_guard<std::recursive_mutex> dlk(deliver_mu_);
    std::map<Token, Subscriber> subs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        latest_ = view;
        ++count_;
        subs = subscribers_;
    }
    for (const auto& kv : subs) deliver(kv.second, view);
    return view;
}

SnapshotPublisher::Token SnapshotPublisher::subscribe(Subscriber fn) {
    std::lock_guard<std::recursive_mutex> dlk(deliver_mu_);
    Token t;
    std::optional<DisplayItems> replay;
    {
        std::lock_guard<std::mutex> lk(mu_);
        t = next_token_++;
        subscribers_.emplace(t, fn);
        replay = latest_;
    }
    if (replay) deliver(fn, *replay);
    return t;
}

void SnapshotPublisher::unsubscribe(Token t) {
    std::lock_guard<std::mutex> lk(mu_);
    subscribers_.erase(t);
}

std::optional<DisplayItems> SnapshotPublisher::latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
}

std::size_t SnapshotPublisher::publications() const {
    std::lock_guard<std::mutex> lk(mu_);
    return count_;
}
