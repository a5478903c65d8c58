#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <vector>
#include <zlib.h>

namespace geoupdate {

class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    // Implementation of IReader. Concatenated members are decompressed in
    // order. A stream that ends before a gzip trailer, or is followed by bytes
    // that do not start another member, is reported as an error (-1).
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool member_done_ = false;
    bool eof_reached_ = false;
    bool drained_source_ = false;
};

// Decompresses a complete in-memory gzip stream into `out`. Fails with EFBIG
// once the output would exceed `max_bytes` (0 = unlimited).
Result Gunzip(std::vector<std::uint8_t> compressed, std::vector<std::uint8_t>& out,
              std::uint64_t max_bytes = 0);

} // namespace geoupdate
