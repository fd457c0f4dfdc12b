#pragma once
#include <shared_mutex>
#include <string>
#include <vector>

// Persistent set of otpauth URI strings.
class OtpUriStore {
public:
    virtual ~OtpUriStore() = default;

    // Stored URIs in insertion order, without duplicates.
    virtual std::vector<std::string> list_uri_strings() const = 0;

    // true if the URI was present and removed; false is a no-op.
    virtual bool remove_uri_string(const std::string& uri) = 0;

    // true if appended; false if already present.
    virtual bool add_uri_string(const std::string& uri) = 0;
};

// File layout: {"uris": ["otpauth://...", ...]}
// A missing file is an empty store. Writes go to "<path>.tmp" then rename.
class JsonFileUriStore : public OtpUriStore {
public:
    explicit JsonFileUriStore(std::string path);

    std::vector<std::string> list_uri_strings() const override;
    bool remove_uri_string(const std::string& uri) override;
    bool add_uri_string(const std::string& uri) override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    mutable std::shared_mutex mu_;

    std::vector<std::string> read_locked() const;       // throws std::runtime_error on malformed json
    void write_locked(const std::vector<std::string>& uris) const;
};
