// include/otp_params.h
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class OtpType { TOTP, HOTP };
enum class OtpAlgo { SHA1, SHA256, SHA512 };

const char* otp_algo_name(OtpAlgo algo) noexcept;   // "SHA1" / "SHA256" / "SHA512"
const char* otp_type_name(OtpType type) noexcept;   // "totp" / "hotp"

// Parsed form of one otpauth:// URI. Immutable once built by the parser.
struct OtpParameters {
    OtpType type = OtpType::TOTP;
    std::string secret;                                  // Base32 text, as found in the URI
    OtpAlgo algo = OtpAlgo::SHA1;
    int digits = 6;
    std::chrono::seconds period{30};                     // TOTP time step
    std::uint64_t counter = 0;                           // HOTP moving factor
    std::optional<std::string> issuer;
    std::string account;
};
