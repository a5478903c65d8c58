#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace geoupdate {

inline constexpr std::string_view kNoUpdateMarker = "No new updates available";

enum class ReplyKind {
    NoUpdate,
    GzipPayload,
    Malformed,
};

const char* ToString(ReplyKind kind);

struct ServerReply {
    ReplyKind kind = ReplyKind::Malformed;
    // Raw gzip bytes; only populated for GzipPayload.
    std::vector<std::uint8_t> payload;

    static ServerReply Classify(std::vector<std::uint8_t> body);
};

} // namespace geoupdate
