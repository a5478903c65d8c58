#include "update/challenge.hpp"

#include "crypto/md5.hpp"

namespace geoupdate {

std::string ComputeChallenge(std::string_view license_key, std::string_view client_address) {
    Md5Hasher hasher;
    hasher.Update(license_key);
    hasher.Update(client_address);
    return hasher.FinalHex();
}

} // namespace geoupdate
