#include "event_queue.h"
#include <utility>

static inline bool is_power_of_two(std::size_t x) { return x && ((x & (x - 1)) == 0); }

std::size_t EventQueue::next_pow2(std::size_t n) noexcept {
    if (n < 8) return 8;
    if (is_power_of_two(n)) return n;
    n--;
    for (std::size_t i = 1; i < sizeof(std::size_t) * 8; i <<= 1) n |= (n >> i);
    return n + 1;
}

EventQueue::EventQueue(std::size_t capacity)
    : buf_(next_pow2(capacity)), mask_(buf_.size() - 1) {}

void EventQueue::put_locked(OtpEvent&& ev) {
    buf_[head_ & mask_] = std::move(ev);
    ++head_;
}

void EventQueue::push(OtpEvent ev) {
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_full_.wait(lk, [this]{ return closed_ || head_ - tail_ < capacity(); });
        if (closed_) throw QueueClosedError();
        put_locked(std::move(ev));
    }
    not_empty_.notify_one();
}

bool EventQueue::try_push(OtpEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) throw QueueClosedError();
        if (head_ - tail_ == capacity()) return false; // full
        put_locked(std::move(ev));
    }
    not_empty_.notify_one();
    return true;
}

bool EventQueue::pop(OtpEvent& out) {
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_empty_.wait(lk, [this]{ return closed_ || head_ != tail_; });
        if (head_ == tail_) return false; // closed and drained
        out = std::move(buf_[tail_ & mask_]);
        ++tail_;
    }
    not_full_.notify_one();
    return true;
}

bool EventQueue::try_pop(OtpEvent& out) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (head_ == tail_) return false; // empty
        out = std::move(buf_[tail_ & mask_]);
        ++tail_;
    }
    not_full_.notify_one();
    return true;
}

void EventQueue::close() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return head_ - tail_;
}

bool EventQueue::empty() const {
    return size() == 0;
}

bool EventQueue::full() const {
    return size() == capacity();
}
