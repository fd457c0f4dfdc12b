// include/password_generator.h
#pragma once
#include "otp_params.h"
#include <memory>
#include <string>

// Produces the current code for one OTP account. Implementations hold no
// state that changes between calls, so one instance may be shared by every
// snapshot an entry appears in.
class PasswordGenerator {
public:
    virtual ~PasswordGenerator() = default;

    // Throws on generation failure (e.g. HMAC error).
    virtual std::string generate() const = 0;
};

class PasswordGeneratorFactory {
public:
    virtual ~PasswordGeneratorFactory() = default;

    // Throws std::invalid_argument if the parameters cannot back a generator.
    virtual std::shared_ptr<const PasswordGenerator> create(const OtpParameters& params) const = 0;
};

// Totp for OtpType::TOTP, Hotp for OtpType::HOTP.
class DefaultPasswordGeneratorFactory : public PasswordGeneratorFactory {
public:
    std::shared_ptr<const PasswordGenerator> create(const OtpParameters& params) const override;
};
