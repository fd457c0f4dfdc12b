// include/entry_registry.h
#pragma once
#include "otp_entry.h"
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class Logger;
class OtpUriParser;
class OtpUriStore;
class PasswordGeneratorFactory;

enum class BootstrapPolicy {
    Skip,    // drop the failing URI, record it, keep loading
    Strict   // first failing URI aborts bootstrap with BootstrapError
};

// what() names the URI with its secret masked; uri() keeps the raw text.
class BootstrapError : public std::runtime_error {
public:
    BootstrapError(std::string uri, const std::string& reason);

    const std::string& uri() const noexcept { return uri_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string uri_;
    std::string reason_;
};

struct BootstrapFailure {
    std::string uri;        // raw, secret included; log OtpUriParser::redact(uri)
    std::string reason;
};

struct BootstrapResult {
    Snapshot snapshot;
    std::vector<BootstrapFailure> failures;   // always empty under Strict
};

// Owns the authoritative snapshot. bootstrap() builds the seed from the
// store; afterwards only the reducer thread calls replace().
class EntryRegistry {
public:
    // Borrow existing instances; no ownership.
    EntryRegistry(const OtpUriStore& store,
                  const OtpUriParser& parser,
                  const PasswordGeneratorFactory& factory,
                  Logger& log,
                  BootstrapPolicy policy = BootstrapPolicy::Skip);

    EntryRegistry(const EntryRegistry&) = delete;
    EntryRegistry& operator=(const EntryRegistry&) = delete;

    // One entry per stored URI, in store order. Installs the result as the
    // current snapshot and returns it with any skipped URIs.
    BootstrapResult bootstrap();

    Snapshot current() const;
    void replace(Snapshot next);

    BootstrapPolicy policy() const noexcept { return policy_; }

private:
    const OtpUriStore& store_;
    const OtpUriParser& parser_;
    const PasswordGeneratorFactory& factory_;
    Logger& log_;
    BootstrapPolicy policy_;

    mutable std::mutex mu_;   // guards the pointer swap only
    Snapshot current_;

    OtpEntry load_entry(const std::string& uri) const;   // throws BootstrapError
};
