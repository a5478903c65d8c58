#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>
#include <vector>

namespace geoupdate {

class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

// Drains `reader` into `out` (replacing its contents). Fails if the reader
// reports an error or the result would exceed `max_bytes` (0 = unlimited).
Result ReadToEnd(IReader& reader, std::vector<std::uint8_t>& out, std::uint64_t max_bytes = 0);

} // namespace geoupdate
