#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace geoupdate {

// Lowercase hex encoding of a 16-byte MD5 digest.
inline constexpr size_t kMd5HexLength = 32;

std::string Md5Hex(std::span<const std::uint8_t> data);
std::string Md5Hex(std::string_view data);
std::string Md5Hex(IReader& reader);
Result Md5HexFile(const std::string& path, std::string& out_hex);

class Md5Hasher {
public:
    Md5Hasher();
    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;
    Md5Hasher(Md5Hasher&&) noexcept;
    Md5Hasher& operator=(Md5Hasher&&) noexcept;
    ~Md5Hasher();

    void Update(std::span<const std::uint8_t> data);
    void Update(std::string_view data);
    // Empty string if the hasher failed at any point or was already finalized.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace geoupdate
