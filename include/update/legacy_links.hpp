#pragma once

#include <string>
#include <vector>

namespace geoupdate {

struct LegacyLink {
    const char* link_name;
    const char* target_name;
};

// Old file names some consumers still open.
inline constexpr LegacyLink kLegacyLinks[] = {
    {"GeoIPCity.dat", "GeoLiteCity.dat"},
    {"GeoIP.dat", "GeoLiteCountry.dat"},
};

// Creates each kLegacyLinks entry in `directory` unless the link name already
// exists. Failures are logged, never fatal. Returns the links created.
std::vector<std::string> CreateLegacyLinks(const std::string& directory);

} // namespace geoupdate
