#include "totp.h"
#include "password_generator.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

using std::chrono::seconds;
using std::chrono::system_clock;

static const char* kSha1Secret   = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
static const char* kSha256Secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZA====";
static const char* kSha512Secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBV"
                                   "GY3TQOJQGEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQGEZDGNA=";

static bool throws_invalid(void (*fn)()) {
    try { fn(); } catch (const std::invalid_argument&) { return true; }
    return false;
}

int main() {
    try {
        // --- RFC 6238 appendix B (8 digits, 30s) ---
        {
            Totp sha1(kSha1Secret, 8, seconds(30), OtpAlgo::SHA1);
            Totp sha256(kSha256Secret, 8, seconds(30), OtpAlgo::SHA256);
            Totp sha512(kSha512Secret, 8, seconds(30), OtpAlgo::SHA512);

            const auto t59 = system_clock::time_point(seconds(59));
            assert(sha1.code_at(t59) == "94287082");
            assert(sha256.code_at(t59) == "46119246");
            assert(sha512.code_at(t59) == "90693936");

            const auto t2 = system_clock::time_point(seconds(1111111109));
            assert(sha1.code_at(t2) == "07081804");   // leading zero kept
            assert(sha256.code_at(t2) == "68084774");
            assert(sha512.code_at(t2) == "25091201");

            const auto t3 = system_clock::time_point(seconds(20000000000LL));
            assert(sha1.code_at(t3) == "65353130");
        }

        // --- lower-case / spaced secrets decode the same ---
        {
            Totp a("gezd gnbv gy3t qojq gezd gnbv gy3t qojq", 8);
            assert(a.code_at(system_clock::time_point(seconds(59))) == "94287082");
        }

        // --- verify() window ---
        {
            Totp t(kSha1Secret, 8);
            assert(t.digits() == 8 && t.period() == seconds(30));
            const auto t59 = system_clock::time_point(seconds(59));
            const auto t89 = system_clock::time_point(seconds(89));
            assert(t.verify("94287082", t59));
            assert(t.verify("94287082", t89, 1));      // previous step accepted
            assert(!t.verify("94287082", t89, 0));
            assert(!t.verify("00000000", t59));
        }

        // --- RFC 4226 appendix D ---
        {
            const char* expected[] = {"755224", "287082", "359152", "969429", "338314",
                                      "254676", "287922", "162583", "399871", "520489"};
            Hotp h(kSha1Secret, 0);
            for (std::uint64_t c = 0; c < 10; ++c) assert(h.code_at(c) == expected[c]);

            Hotp fixed(kSha1Secret, 9);
            assert(fixed.counter() == 9);
            assert(fixed.generate() == "520489");
            assert(fixed.generate() == "520489");      // counter does not advance
        }

        // --- factory picks the generator from the type ---
        {
            DefaultPasswordGeneratorFactory f;
            OtpParameters p;
            p.type = OtpType::HOTP;
            p.secret = "JBSWY3DPEHPK3PXP";
            p.counter = 5;
            assert(f.create(p)->generate() == "768897");

            p.type = OtpType::TOTP;
            auto g = f.create(p);
            assert(g->generate().size() == 6);
        }

        // --- construction errors ---
        assert(throws_invalid([]{ Totp t(kSha1Secret, 5); }));
        assert(throws_invalid([]{ Totp t(kSha1Secret, 11); }));
        assert(throws_invalid([]{ Totp t(kSha1Secret, 6, seconds(0)); }));
        assert(throws_invalid([]{ Totp t("not base32!", 6); }));
        assert(throws_invalid([]{ Hotp h("", 0); }));

        assert(std::string(otp_algo_name(OtpAlgo::SHA256)) == "SHA256");
        assert(std::string(otp_type_name(OtpType::HOTP)) == "hotp");

        assert(otp_detail::is_base32("JBSWY3DPEHPK3PXP"));
        assert(!otp_detail::is_base32("JBSWY3DPEHPK3PX1"));
        assert(!otp_detail::is_base32("===="));

        std::cout << "TOTP test passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "totp_test exception: " << e.what() << "\n";
        return 2;
    }
}
