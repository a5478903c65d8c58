#include "io/io.hpp"

#include <cerrno>
#include <string>

namespace geoupdate {

Result ReadToEnd(IReader& reader, std::vector<std::uint8_t>& out, std::uint64_t max_bytes) {
    out.clear();
    if (auto total = reader.TotalSize(); total && (max_bytes == 0 || *total <= max_bytes)) {
        out.reserve(static_cast<size_t>(*total));
    }

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "read failed");
        if (max_bytes > 0 && out.size() + static_cast<size_t>(n) > max_bytes) {
            return Result::Fail(EFBIG, "input exceeds " + std::to_string(max_bytes) + " bytes");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

} // namespace geoupdate
