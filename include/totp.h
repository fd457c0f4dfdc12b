#pragma once
#include "otp_params.h"
#include "password_generator.h"
#include <string>
#include <cstdint>
#include <chrono>

// RFC 4226 building blocks shared by Totp and Hotp.
namespace otp_detail {
    std::string base32_decode(const std::string& b32);        // returns raw bytes, throws on bad char
    bool is_base32(const std::string& b32) noexcept;
    std::string hotp(const std::string& key, std::uint64_t counter,
                     int digits, OtpAlgo algo);              // HMAC + dynamic truncate
    void check_digits(int digits);                           // 6..10 inclusive
}

class Totp : public PasswordGenerator {
public:
    Totp(std::string secret_base32,
         int digits = 6,
         std::chrono::seconds period = std::chrono::seconds(30),
         OtpAlgo algo = OtpAlgo::SHA1);

    std::string code_at(std::chrono::system_clock::time_point tp) const;

    // Code for the current wall-clock time step.
    std::string generate() const override;

    bool verify(const std::string& code,
                std::chrono::system_clock::time_point tp,
                int window_steps = 1) const;

    int digits() const noexcept { return digits_; }
    std::chrono::seconds period() const noexcept { return period_; }

private:
    std::string secret_; // raw bytes after Base32 decode
    int digits_;
    std::chrono::seconds period_;
    OtpAlgo algo_;

    static std::uint64_t time_counter(std::chrono::system_clock::time_point tp, std::chrono::seconds period);
};

// Counter-based variant: the counter is fixed at construction, so generate()
// keeps returning the same code until the entry is re-created.
class Hotp : public PasswordGenerator {
public:
    Hotp(std::string secret_base32,
         std::uint64_t counter,
         int digits = 6,
         OtpAlgo algo = OtpAlgo::SHA1);

    std::string code_at(std::uint64_t counter) const;
    std::string generate() const override;

    std::uint64_t counter() const noexcept { return counter_; }

private:
    std::string secret_;
    std::uint64_t counter_;
    int digits_;
    OtpAlgo algo_;
};
