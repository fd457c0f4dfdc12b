// include/event_queue.h
#pragma once
#include "otp_entry.h"
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <vector>

// Thrown when an event is submitted after close(): a startup/teardown
// ordering bug on the caller's side.
class QueueClosedError : public std::runtime_error {
public:
    QueueClosedError() : std::runtime_error("event queue is closed") {}
};

// Bounded FIFO between event producers (timer, user actions) and the single
// reducer thread. Any number of producers; one consumer.
class EventQueue {
public:
    // capacity will be rounded up to next power of two (min 8)
    explicit EventQueue(std::size_t capacity);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;
    EventQueue(EventQueue&&) = delete;
    EventQueue& operator=(EventQueue&&) = delete;

    // Producers
    // Blocks while full; never drops. Throws QueueClosedError once closed.
    void push(OtpEvent ev);
    // Returns false if full; the event is not queued. Throws QueueClosedError once closed.
    bool try_push(OtpEvent ev);

    // Consumer
    // Blocks until an event is available. Returns false only when the queue
    // is closed and fully drained.
    bool pop(OtpEvent& out);
    // Returns false if empty
    bool try_pop(OtpEvent& out);

    // Rejects further pushes and wakes every waiter. Queued events stay
    // poppable.
    void close() noexcept;
    bool closed() const;

    std::size_t size() const;
    std::size_t capacity() const noexcept { return mask_ + 1; }
    bool empty() const;
    bool full() const;

private:
    // power-of-two ring: index & mask_ for wrap
    std::vector<OtpEvent> buf_;
    const std::size_t mask_;             // capacity - 1

    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::size_t head_ = 0;               // next write
    std::size_t tail_ = 0;               // next read
    bool closed_ = false;

    void put_locked(OtpEvent&& ev);
    static std::size_t next_pow2(std::size_t n) noexcept;
};
