#include "update/digest_tracker.hpp"

#include "crypto/md5.hpp"
#include "util/logger.hpp"

namespace geoupdate {

std::string DigestOfFile(const std::string& path) {
    std::string hex;
    auto res = Md5HexFile(path, hex);
    if (!res.is_ok()) {
        LogDebug("No usable local copy (%s), using sentinel digest", res.message().c_str());
        return kSentinelDigest;
    }
    return hex;
}

std::string DigestOfBytes(std::span<const std::uint8_t> data) {
    return Md5Hex(data);
}

} // namespace geoupdate
