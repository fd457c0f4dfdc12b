// include/otp_uri_parser.h
#pragma once
#include "otp_params.h"
#include <optional>
#include <string>

struct OtpUriParseResult {
    std::optional<OtpParameters> params;   // set on success
    std::string error;                     // set on failure

    bool ok() const noexcept { return params.has_value(); }
};

class OtpUriParser {
public:
    // Parse one otpauth URI, e.g.:
    //  otpauth://totp/ACME%20Co:john@example.com?secret=JBSWY3DPEHPK3PXP&issuer=ACME%20Co&period=30
    //  otpauth://hotp/alice?secret=GEZDGNBV&counter=7&digits=8
    // Never throws for malformed input; the reason is reported in `error`.
    OtpUriParseResult parse(const std::string& uri) const;

    // The same URI with every `secret` query value replaced by "***".
    // Safe to log; anything else is left as written.
    static std::string redact(const std::string& uri);

private:
    static std::optional<std::string> percent_decode(const std::string& in, bool plus_is_space);
};
