#include "util/duration.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace geoupdate {

namespace {

struct Unit {
    std::string_view name;
    std::int64_t nanos;
};

constexpr Unit kUnits[] = {
    {"ns", 1},
    {"us", 1000},
    {"ms", 1000 * 1000},
    {"s", 1000LL * 1000 * 1000},
    {"m", 60LL * 1000 * 1000 * 1000},
    {"h", 3600LL * 1000 * 1000 * 1000},
};

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

const Unit* MatchUnit(std::string_view s, size_t& len) {
    // Two-letter units first so "ms" is not read as "m".
    for (const auto& u : kUnits) {
        if (u.name.size() == 2 && s.substr(0, 2) == u.name) {
            len = 2;
            return &u;
        }
    }
    for (const auto& u : kUnits) {
        if (u.name.size() == 1 && !s.empty() && s[0] == u.name[0]) {
            len = 1;
            return &u;
        }
    }
    return nullptr;
}

} // namespace

std::expected<std::chrono::nanoseconds, std::string> ParseDuration(std::string_view text) {
    const std::string quoted = "'" + std::string(text) + "'";
    if (text.empty()) return std::unexpected("empty duration");
    if (text.front() == '-') return std::unexpected("negative duration " + quoted);
    if (text.front() == '+') text.remove_prefix(1);
    if (text == "0") return std::chrono::nanoseconds(0);

    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    std::int64_t total = 0;
    std::string_view s = text;

    while (!s.empty()) {
        std::int64_t whole = 0;
        size_t i = 0;
        bool any_digits = false;
        for (; i < s.size() && IsDigit(s[i]); ++i) {
            any_digits = true;
            if (whole > (kMax - (s[i] - '0')) / 10) return std::unexpected("duration overflows " + quoted);
            whole = whole * 10 + (s[i] - '0');
        }

        std::int64_t frac = 0;
        std::int64_t frac_scale = 1;
        if (i < s.size() && s[i] == '.') {
            ++i;
            for (; i < s.size() && IsDigit(s[i]); ++i) {
                any_digits = true;
                // Digits beyond nanosecond precision are dropped.
                if (frac_scale < 1000LL * 1000 * 1000) {
                    frac = frac * 10 + (s[i] - '0');
                    frac_scale *= 10;
                }
            }
        }
        if (!any_digits) return std::unexpected("invalid duration " + quoted);

        size_t unit_len = 0;
        const Unit* unit = MatchUnit(s.substr(i), unit_len);
        if (!unit) return std::unexpected("missing or unknown unit in duration " + quoted);

        if (whole > kMax / unit->nanos) return std::unexpected("duration overflows " + quoted);
        std::int64_t part = whole * unit->nanos;
        part += static_cast<std::int64_t>(static_cast<long double>(frac) * unit->nanos / frac_scale);
        if (total > kMax - part) return std::unexpected("duration overflows " + quoted);
        total += part;

        s.remove_prefix(i + unit_len);
    }

    return std::chrono::nanoseconds(total);
}

std::string FormatDuration(std::chrono::nanoseconds d) {
    std::int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    if (ns < 0) {
        sign = "-";
        ns = -ns;
    }

    char buf[64];
    if (ns < 1000) {
        std::snprintf(buf, sizeof(buf), "%" PRId64 "ns", ns);
        return sign + buf;
    }
    if (ns < 1000LL * 1000) {
        std::snprintf(buf, sizeof(buf), "%gus", static_cast<double>(ns) / 1e3);
        return sign + buf;
    }
    if (ns < 1000LL * 1000 * 1000) {
        std::snprintf(buf, sizeof(buf), "%gms", static_cast<double>(ns) / 1e6);
        return sign + buf;
    }

    const std::int64_t hours = ns / (3600LL * 1000 * 1000 * 1000);
    ns %= 3600LL * 1000 * 1000 * 1000;
    const std::int64_t minutes = ns / (60LL * 1000 * 1000 * 1000);
    ns %= 60LL * 1000 * 1000 * 1000;
    const double seconds = static_cast<double>(ns) / 1e9;

    std::string out = sign;
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%" PRId64 "h", hours);
        out += buf;
    }
    if (hours > 0 || minutes > 0) {
        std::snprintf(buf, sizeof(buf), "%" PRId64 "m", minutes);
        out += buf;
    }
    std::snprintf(buf, sizeof(buf), "%.9g", seconds);
    out += buf;
    out += "s";
    return out;
}

} // namespace geoupdate
