// tests/test_support.h
#pragma once
#include "otp_entry.h"
#include "otp_uri_store.h"
#include "password_generator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Returns base, base+1, base+2, ... on successive calls.
class CountingGenerator : public PasswordGenerator {
public:
    explicit CountingGenerator(unsigned base) : base_(base) {}

    std::string generate() const override {
        std::ostringstream oss;
        oss << std::setw(6) << std::setfill('0') << (base_ + calls_.fetch_add(1));
        return oss.str();
    }

    unsigned calls() const { return calls_.load(); }

private:
    unsigned base_;
    mutable std::atomic<unsigned> calls_{0};
};

// First `ok_calls` calls succeed, then every call throws.
class FailingGenerator : public PasswordGenerator {
public:
    explicit FailingGenerator(unsigned ok_calls) : ok_calls_(ok_calls) {}

    std::string generate() const override {
        if (calls_.fetch_add(1) >= ok_calls_) throw std::runtime_error("secret rejected");
        return "424242";
    }

private:
    unsigned ok_calls_;
    mutable std::atomic<unsigned> calls_{0};
};

// Account name -> first code. Accounts named "broken" cannot get a generator.
class CountingFactory : public PasswordGeneratorFactory {
public:
    std::map<std::string, unsigned> bases;

    std::shared_ptr<const PasswordGenerator> create(const OtpParameters& p) const override {
        if (p.account == "broken") throw std::invalid_argument("unusable parameters");
        auto it = bases.find(p.account);
        return std::make_shared<const CountingGenerator>(it == bases.end() ? 100000u : it->second);
    }
};

// In-memory store that records every removal attempt.
class MemoryUriStore : public OtpUriStore {
public:
    explicit MemoryUriStore(std::vector<std::string> uris = {}) : uris_(std::move(uris)) {}

    std::vector<std::string> list_uri_strings() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return uris_;
    }

    bool remove_uri_string(const std::string& uri) override {
        std::lock_guard<std::mutex> lk(mu_);
        removals_.push_back(uri);
        if (fail_removals_) throw std::runtime_error("disk full");
        auto it = std::find(uris_.begin(), uris_.end(), uri);
        if (it == uris_.end()) return false;
        uris_.erase(it);
        return true;
    }

    bool add_uri_string(const std::string& uri) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (std::find(uris_.begin(), uris_.end(), uri) != uris_.end()) return false;
        uris_.push_back(uri);
        return true;
    }

    std::vector<std::string> removals() const {
        std::lock_guard<std::mutex> lk(mu_);
        return removals_;
    }

    void fail_removals(bool on) {
        std::lock_guard<std::mutex> lk(mu_);
        fail_removals_ = on;
    }

private:
    mutable std::mutex mu_;
    std::vector<std::string> uris_;
    std::vector<std::string> removals_;
    bool fail_removals_ = false;
};

inline OtpEntry make_entry(const std::string& account,
                           std::shared_ptr<const PasswordGenerator> gen,
                           const std::string& uri) {
    OtpEntry e;
    e.account = account;
    e.issuer = "ACME";
    e.generator = std::move(gen);
    e.code = e.generator->generate();
    e.uri = uri;
    return e;
}

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
