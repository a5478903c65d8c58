#include "io/gzip_reader.hpp"

#include "io/memory_reader.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

namespace geoupdate {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && !drained_source_) {
            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                drained_source_ = true;
            } else {
                strm_.avail_in = static_cast<uInt>(n);
                strm_.next_in = in_buffer_.data();
            }
        }

        if (member_done_) {
            if (strm_.avail_in == 0) {
                eof_reached_ = true;
                break;
            }
            // More bytes after a member: they must form another gzip member.
            // zlib rejects anything without the 1f 8b magic as Z_DATA_ERROR.
            if (inflateReset(&strm_) != Z_OK) return -1;
            member_done_ = false;
        }

        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            member_done_ = true;
            continue;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }

        if (strm_.avail_in == 0 && drained_source_) {
            break;
        }
    }

    const size_t produced = out.size() - strm_.avail_out;

    // Source is gone and zlib never saw the trailer: truncated member.
    if (produced == 0 && !eof_reached_) {
        return -1;
    }

    return static_cast<ssize_t>(produced);
}

Result Gunzip(std::vector<std::uint8_t> compressed, std::vector<std::uint8_t>& out,
              std::uint64_t max_bytes) {
    std::unique_ptr<GzipReader> reader;
    try {
        reader = std::make_unique<GzipReader>(std::make_unique<MemoryReader>(std::move(compressed)));
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("Gzip init failed: ") + e.what());
    }

    auto res = ReadToEnd(*reader, out, max_bytes);
    if (!res.is_ok()) {
        out.clear();
        if (res.err == EFBIG) {
            return Result::Fail(EFBIG, "decompressed " + res.message());
        }
        return Result::Fail(-1, "corrupt or truncated gzip stream");
    }
    return Result::Ok();
}

} // namespace geoupdate
