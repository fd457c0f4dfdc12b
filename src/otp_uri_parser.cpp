// src/otp_uri_parser.cpp
#include "otp_uri_parser.h"
#include "totp.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <string>

// ---- helpers ---------------------------------------------------------------

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

// Digits only, no sign; nullopt on empty input or overflow.
static std::optional<std::uint64_t> parse_u64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}

static OtpUriParseResult fail(std::string why) {
    OtpUriParseResult r;
    r.error = std::move(why);
    return r;
}

// ---- OtpUriParser ----------------------------------------------------------

std::optional<std::string> OtpUriParser::percent_decode(const std::string& in, bool plus_is_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            const int hi = hex_val(in[i + 1]);
            const int lo = hex_val(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && plus_is_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string OtpUriParser::redact(const std::string& uri) {
    const auto qmark = uri.find('?');
    if (qmark == std::string::npos) return uri;

    // fragment included: a secret after '#' is not parsed but still secret
    std::string out = uri.substr(0, qmark + 1);
    std::size_t pos = qmark + 1;
    while (true) {
        const auto amp = uri.find_first_of("&#", pos);
        const std::string item = uri.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        const auto eq = item.find('=');
        const auto key = percent_decode(item.substr(0, eq), true);
        if (eq != std::string::npos && (!key || to_lower(*key) == "secret")) {
            out += item.substr(0, eq + 1) + "***";
        } else {
            out += item;
        }
        if (amp == std::string::npos) break;
        out.push_back(uri[amp]);
        pos = amp + 1;
    }
    return out;
}

OtpUriParseResult OtpUriParser::parse(const std::string& uri) const {
    const auto scheme_end = uri.find("://");
    if (scheme_end == std::string::npos) return fail("missing scheme");
    if (to_lower(uri.substr(0, scheme_end)) != "otpauth") return fail("scheme is not otpauth");

    std::string rest = uri.substr(scheme_end + 3);
    if (auto hash = rest.find('#'); hash != std::string::npos) rest.erase(hash);

    const auto slash = rest.find('/');
    if (slash == std::string::npos) return fail("missing label");

    OtpParameters p;
    const std::string type = to_lower(rest.substr(0, slash));
    if (type == "totp")      p.type = OtpType::TOTP;
    else if (type == "hotp") p.type = OtpType::HOTP;
    else return fail("unsupported otp type: " + type);

    const auto qmark = rest.find('?', slash + 1);
    const std::string raw_label = rest.substr(slash + 1, qmark == std::string::npos ? std::string::npos : qmark - slash - 1);
    const std::string raw_query = qmark == std::string::npos ? std::string() : rest.substr(qmark + 1);

    // label: "Issuer:Account" or "Account"
    auto label = percent_decode(raw_label, false);
    if (!label) return fail("bad percent-encoding in label");
    if (label->empty()) return fail("missing label");

    std::optional<std::string> label_issuer;
    std::string account = *label;
    if (auto colon = label->find(':'); colon != std::string::npos) {
        label_issuer = label->substr(0, colon);
        account = label->substr(colon + 1);
        const auto first = account.find_first_not_of(' ');
        account = first == std::string::npos ? std::string() : account.substr(first);
    }
    if (account.empty()) return fail("missing account name");
    p.account = account;

    std::map<std::string, std::string> query;
    std::size_t pos = 0;
    while (!raw_query.empty()) {
        auto amp = raw_query.find('&', pos);
        const std::string item = raw_query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!item.empty()) {
            const auto eq = item.find('=');
            auto key = percent_decode(item.substr(0, eq), true);
            auto val = percent_decode(eq == std::string::npos ? std::string() : item.substr(eq + 1), true);
            if (!key || !val) return fail("bad percent-encoding in query");
            query[to_lower(*key)] = *val;
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }

    auto it = query.find("secret");
    if (it == query.end() || it->second.empty()) return fail("missing secret");
    if (!otp_detail::is_base32(it->second)) return fail("secret is not valid Base32");
    p.secret = it->second;

    if ((it = query.find("algorithm")) != query.end()) {
        const std::string a = to_lower(it->second);
        if (a == "sha1")        p.algo = OtpAlgo::SHA1;
        else if (a == "sha256") p.algo = OtpAlgo::SHA256;
        else if (a == "sha512") p.algo = OtpAlgo::SHA512;
        else return fail("unsupported algorithm: " + it->second);
    }

    if ((it = query.find("digits")) != query.end()) {
        auto d = parse_u64(it->second);
        if (!d || *d < 6 || *d > 10) return fail("digits must be between 6 and 10");
        p.digits = static_cast<int>(*d);
    }

    if ((it = query.find("period")) != query.end()) {
        auto s = parse_u64(it->second);
        if (!s || *s == 0 || *s > 86400) return fail("period must be a positive number of seconds");
        p.period = std::chrono::seconds(static_cast<long long>(*s));
    }

    if ((it = query.find("counter")) != query.end()) {
        auto c = parse_u64(it->second);
        if (!c) return fail("counter must be a non-negative integer");
        p.counter = *c;
    }

    // issuer parameter wins over the label prefix
    if ((it = query.find("issuer")) != query.end() && !it->second.empty()) {
        p.issuer = it->second;
    } else if (label_issuer && !label_issuer->empty()) {
        p.issuer = label_issuer;
    }

    OtpUriParseResult r;
    r.params = std::move(p);
    return r;
}
