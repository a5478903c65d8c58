#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace geoupdate {

// Digest sent when there is no local content yet.
inline constexpr const char kSentinelDigest[] = "00000000000000000000000000000000";

// MD5 of the file at `path`, or kSentinelDigest if it cannot be read.
std::string DigestOfFile(const std::string& path);

std::string DigestOfBytes(std::span<const std::uint8_t> data);

} // namespace geoupdate
