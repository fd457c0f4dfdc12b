#include "event_reducer.h"
#include "logger.h"
#include "otp_uri_store.h"

#include <exception>
#include <string>

EventReducer::EventReducer(OtpUriStore& store, Logger& log)
    : store_(store), log_(log) {}

Snapshot EventReducer::apply(const Snapshot& current, const OtpEvent& ev) {
    ++reductions_;
    if (const auto* del = std::get_if<DeleteEvent>(&ev)) {
        return remove(current, del->entry);
    }
    return regenerate(current);
}

Snapshot EventReducer::regenerate(const Snapshot& current) {
    OtpEntries next;
    next.reserve(current->size());
    for (const auto& e : *current) {
        try {
            next.push_back(e.with_code(e.generator->generate()));
        } catch (const std::exception& ex) {
            log_.warn_fmt("regenerate failed for ", e.account, ", keeping previous code: ", ex.what());
            next.push_back(e);
        }
    }
    return make_snapshot(std::move(next));
}

Snapshot EventReducer::remove(const Snapshot& current, const OtpEntry& target) {
    OtpEntries next;
    next.reserve(current->size());
    for (const auto& e : *current) {
        if (e.uri != target.uri) next.push_back(e);
    }

    try {
        if (!store_.remove_uri_string(target.uri)) {
            log_.debug_fmt("store had no uri for ", target.account, "; nothing removed");
        }
    } catch (const std::exception& ex) {
        log_.error_fmt("store removal failed for ", target.account, ": ", ex.what());
    }

    if (next.size() == current->size()) {
        log_.debug_fmt("delete of ", target.account, " matched no entry");
    } else {
        log_.info_fmt("deleted otp entry ", target.account);
    }
    return make_snapshot(std::move(next));
}
