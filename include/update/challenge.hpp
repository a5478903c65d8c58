#pragma once

#include <string>
#include <string_view>

namespace geoupdate {

// Authentication token for update polls: md5(license_key || client_address).
std::string ComputeChallenge(std::string_view license_key, std::string_view client_address);

} // namespace geoupdate
