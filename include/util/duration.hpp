#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace geoupdate {

// Parses durations such as "90s", "1h30m", "1.5h" or "250ms".
// Units: ns, us, ms, s, m, h. "0" is accepted without a unit.
std::expected<std::chrono::nanoseconds, std::string> ParseDuration(std::string_view text);

// Human-readable form, e.g. "1h30m0s", "2.5s", "300ms".
std::string FormatDuration(std::chrono::nanoseconds d);

} // namespace geoupdate
