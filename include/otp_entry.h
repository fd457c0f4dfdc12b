// include/otp_entry.h
#pragma once
#include "password_generator.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Live state of one tracked account. Only `code` changes over its lifetime,
// and only by replacing the whole value.
struct OtpEntry {
    std::string code;                                    // last generated code
    std::string account;
    std::optional<std::string> issuer;
    std::shared_ptr<const PasswordGenerator> generator;  // bound to this entry's parameters
    std::string uri;                                     // source URI, unique identity in the store

    OtpEntry with_code(std::string new_code) const {
        OtpEntry e = *this;
        e.code = std::move(new_code);
        return e;
    }
};

inline bool operator==(const OtpEntry& a, const OtpEntry& b) {
    return a.code == b.code && a.account == b.account && a.issuer == b.issuer &&
           a.generator == b.generator && a.uri == b.uri;
}
inline bool operator!=(const OtpEntry& a, const OtpEntry& b) { return !(a == b); }

// Ordered, immutable collection; a new one is built for every reduction.
using OtpEntries = std::vector<OtpEntry>;
using Snapshot = std::shared_ptr<const OtpEntries>;

inline Snapshot make_snapshot(OtpEntries entries) {
    return std::make_shared<const OtpEntries>(std::move(entries));
}

struct RegenerateEvent {};

struct DeleteEvent {
    OtpEntry entry;   // the exact value the delete request was issued against
};

using OtpEvent = std::variant<RegenerateEvent, DeleteEvent>;
