#include "password_generator.h"
#include "totp.h"

#include <memory>

const char* otp_algo_name(OtpAlgo algo) noexcept {
    switch (algo) {
        case OtpAlgo::SHA1:   return "SHA1";
        case OtpAlgo::SHA256: return "SHA256";
        case OtpAlgo::SHA512: return "SHA512";
    }
    return "SHA1";
}

const char* otp_type_name(OtpType type) noexcept {
    return type == OtpType::HOTP ? "hotp" : "totp";
}

std::shared_ptr<const PasswordGenerator>
DefaultPasswordGeneratorFactory::create(const OtpParameters& params) const {
    if (params.type == OtpType::HOTP) {
        return std::make_shared<const Hotp>(params.secret, params.counter, params.digits, params.algo);
    }
    return std::make_shared<const Totp>(params.secret, params.digits, params.period, params.algo);
}
