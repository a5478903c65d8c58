#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace geoupdate::config {

inline constexpr const char kDefaultConfigPath[] = "/etc/geoupdate/geoupdate.json";

struct UpdaterConfig {
    std::string source = "updates.maxmind.com";
    std::string protocol = "https";
    std::string directory = "/usr/local/var/GeoIP";
    std::string user_id = "999999";
    std::string license_key = "000000000000";
    std::vector<std::string> product_ids = {"506", "533", "517"};
    bool links = true;
    std::chrono::nanoseconds random_delay{0};
    std::uint64_t timeout_seconds = 0;

    // Overlays keys present in the JSON file at `path` onto this config.
    Result LoadFile(const std::string& path);

    Result Validate() const;
};

// "506, 533,,517" -> {"506", "533", "517"}
std::vector<std::string> SplitProductIds(std::string_view csv);

} // namespace geoupdate::config
