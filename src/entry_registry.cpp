#include "entry_registry.h"
#include "logger.h"
#include "otp_uri_parser.h"
#include "otp_uri_store.h"
#include "password_generator.h"

#include <exception>
#include <string>
#include <utility>

BootstrapError::BootstrapError(std::string uri, const std::string& reason)
    : std::runtime_error("cannot load otp entry " + OtpUriParser::redact(uri) + ": " + reason),
      uri_(std::move(uri)), reason_(reason) {}

EntryRegistry::EntryRegistry(const OtpUriStore& store,
                             const OtpUriParser& parser,
                             const PasswordGeneratorFactory& factory,
                             Logger& log,
                             BootstrapPolicy policy)
    : store_(store), parser_(parser), factory_(factory), log_(log), policy_(policy),
      current_(make_snapshot({})) {}

OtpEntry EntryRegistry::load_entry(const std::string& uri) const {
    auto parsed = parser_.parse(uri);
    if (!parsed.ok()) throw BootstrapError(uri, parsed.error);
    const OtpParameters& params = *parsed.params;

    OtpEntry e;
    try {
        e.generator = factory_.create(params);
        e.code = e.generator->generate();
    } catch (const std::exception& ex) {
        throw BootstrapError(uri, ex.what());
    }
    e.account = params.account;
    e.issuer = params.issuer;
    e.uri = uri;
    return e;
}

BootstrapResult EntryRegistry::bootstrap() {
    const auto uris = store_.list_uri_strings();

    BootstrapResult result;
    OtpEntries entries;
    entries.reserve(uris.size());

    for (const auto& uri : uris) {
        try {
            entries.push_back(load_entry(uri));
        } catch (const BootstrapError& e) {
            if (policy_ == BootstrapPolicy::Strict) {
                log_.error(e.what());
                throw;
            }
            log_.warn(std::string("skipping: ") + e.what());
            result.failures.push_back({uri, e.reason()});
        }
    }

    log_.info_fmt("bootstrap loaded ", entries.size(), " of ", uris.size(), " otp entries");
    result.snapshot = make_snapshot(std::move(entries));
    replace(result.snapshot);
    return result;
}

Snapshot EntryRegistry::current() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_;
}

void EntryRegistry::replace(Snapshot next) {
    std::lock_guard<std::mutex> lk(mu_);
    current_ = std::move(next);
}
