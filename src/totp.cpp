#include "totp.h"

#include <openssl/hmac.h>
#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

// Base32 alphabet per RFC 4648
int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

// uppercase, strip spaces and '=' padding
std::string normalize_b32(const std::string& in_raw) {
    std::string in;
    in.reserve(in_raw.size());
    for (char c : in_raw) {
        if (c == '=') continue;
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        in.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return in;
}

const EVP_MD* md_for_algo(OtpAlgo algo) {
    switch (algo) {
        case OtpAlgo::SHA1:   return EVP_sha1();
        case OtpAlgo::SHA256: return EVP_sha256();
        case OtpAlgo::SHA512: return EVP_sha512();
    }
    return EVP_sha1();
}

std::string left_pad_int(std::uint32_t val, int digits) {
    std::uint64_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;
    std::uint64_t code = val % mod;

    std::ostringstream oss;
    oss << std::setw(digits) << std::setfill('0') << code;
    return oss.str();
}

std::string decode_secret(const std::string& b32) {
    std::string key = otp_detail::base32_decode(b32);
    if (key.empty()) throw std::invalid_argument("OTP: empty secret");
    return key;
}

} // namespace

namespace otp_detail {

std::string base32_decode(const std::string& b32) {
    const std::string in = normalize_b32(b32);

    std::string out;
    out.reserve(in.size() * 5 / 8 + 1);

    std::uint32_t buffer = 0;
    int bits_left = 0;

    for (char c : in) {
        int v = b32_val(c);
        if (v < 0) throw std::invalid_argument("OTP: invalid Base32 character");
        buffer = (buffer << 5) | static_cast<std::uint32_t>(v);
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            out.push_back(static_cast<char>((buffer >> bits_left) & 0xFF));
        }
    }
    // trailing bits short of a byte are dropped; unpadded input is accepted
    return out;
}

bool is_base32(const std::string& b32) noexcept {
    const std::string in = normalize_b32(b32);
    if (in.empty()) return false;
    for (char c : in) {
        if (b32_val(c) < 0) return false;
    }
    return true;
}

void check_digits(int digits) {
    if (digits < 6 || digits > 10) {
        throw std::invalid_argument("OTP: digits must be between 6 and 10");
    }
}

std::string hotp(const std::string& key,
                 std::uint64_t counter,
                 int digits,
                 OtpAlgo algo)
{
    // counter in big-endian 8 bytes
    std::array<unsigned char, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    const EVP_MD* md = md_for_algo(algo);
    unsigned int len = static_cast<unsigned int>(EVP_MD_size(md));
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};

    if (!HMAC(md,
              reinterpret_cast<const unsigned char*>(key.data()), static_cast<int>(key.size()),
              msg.data(), msg.size(),
              mac.data(), &len)) {
        throw std::runtime_error("OTP: HMAC failed");
    }

    // dynamic truncation (RFC 4226)
    int offset = mac[len - 1] & 0x0F;
    std::uint32_t bin_code =
        (static_cast<std::uint32_t>(mac[offset]   & 0x7F) << 24) |
        (static_cast<std::uint32_t>(mac[offset+1] & 0xFF) << 16) |
        (static_cast<std::uint32_t>(mac[offset+2] & 0xFF) <<  8) |
        (static_cast<std::uint32_t>(mac[offset+3] & 0xFF) <<  0);

    return left_pad_int(bin_code, digits);
}

} // namespace otp_detail

// ----------- Totp -----------

Totp::Totp(std::string secret_base32,
           int digits,
           std::chrono::seconds period,
           OtpAlgo algo)
    : secret_(decode_secret(secret_base32)),
      digits_(digits),
      period_(period),
      algo_(algo)
{
    otp_detail::check_digits(digits_);
    if (period_.count() <= 0) {
        throw std::invalid_argument("TOTP: period must be positive");
    }
}

std::uint64_t Totp::time_counter(std::chrono::system_clock::time_point tp,
                                 std::chrono::seconds period) {
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(tp.time_since_epoch()).count();
    return static_cast<std::uint64_t>(secs >= 0 ? secs : 0) / static_cast<std::uint64_t>(period.count());
}

std::string Totp::code_at(std::chrono::system_clock::time_point tp) const {
    return otp_detail::hotp(secret_, time_counter(tp, period_), digits_, algo_);
}

std::string Totp::generate() const {
    return code_at(std::chrono::system_clock::now());
}

bool Totp::verify(const std::string& code,
                  std::chrono::system_clock::time_point tp,
                  int window_steps) const
{
    const std::uint64_t ctr = time_counter(tp, period_);
    if (code_at(tp) == code) return true;
    for (int w = 1; w <= window_steps; ++w) {
        if (otp_detail::hotp(secret_, ctr + w, digits_, algo_) == code) return true;
        if (ctr >= static_cast<std::uint64_t>(w) &&
            otp_detail::hotp(secret_, ctr - w, digits_, algo_) == code) return true;
    }
    return false;
}

// ----------- Hotp -----------

Hotp::Hotp(std::string secret_base32,
           std::uint64_t counter,
           int digits,
           OtpAlgo algo)
    : secret_(decode_secret(secret_base32)),
      counter_(counter),
      digits_(digits),
      algo_(algo)
{
    otp_detail::check_digits(digits_);
}

std::string Hotp::code_at(std::uint64_t counter) const {
    return otp_detail::hotp(secret_, counter, digits_, algo_);
}

std::string Hotp::generate() const {
    return code_at(counter_);
}
