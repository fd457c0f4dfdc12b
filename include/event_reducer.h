// include/event_reducer.h
#pragma once
#include "otp_entry.h"
#include <atomic>
#include <cstddef>

class Logger;
class OtpUriStore;

// One reduction step: (snapshot, event) -> next snapshot. Never mutates its
// input. Called from the single reducer thread only.
class EventReducer {
public:
    EventReducer(OtpUriStore& store, Logger& log);

    Snapshot apply(const Snapshot& current, const OtpEvent& ev);

    // Every entry re-generated from its own generator, same order. An entry
    // whose generator throws keeps its previous code.
    Snapshot regenerate(const Snapshot& current);

    // Drops the entry whose source URI matches `target` and asks the store to
    // forget that URI, even if the entry is already gone.
    Snapshot remove(const Snapshot& current, const OtpEntry& target);

    std::size_t reductions() const noexcept { return reductions_.load(); }

private:
    OtpUriStore& store_;
    Logger& log_;
    std::atomic<std::size_t> reductions_{0};
};
