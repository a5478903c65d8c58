#include "update/server_reply.hpp"

#include <algorithm>

namespace geoupdate {

namespace {

constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

bool HasPrefix(const std::vector<std::uint8_t>& body, std::string_view prefix) {
    return body.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), body.begin(),
                      [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
}

} // namespace

const char* ToString(ReplyKind kind) {
    switch (kind) {
        case ReplyKind::NoUpdate:    return "no-update";
        case ReplyKind::GzipPayload: return "gzip";
        case ReplyKind::Malformed:   return "malformed";
    }
    return "unknown";
}

ServerReply ServerReply::Classify(std::vector<std::uint8_t> body) {
    ServerReply reply;
    if (HasPrefix(body, kNoUpdateMarker)) {
        reply.kind = ReplyKind::NoUpdate;
    } else if (body.size() >= sizeof(kGzipMagic) && body[0] == kGzipMagic[0] &&
               body[1] == kGzipMagic[1]) {
        reply.kind = ReplyKind::GzipPayload;
        reply.payload = std::move(body);
    } else {
        reply.kind = ReplyKind::Malformed;
    }
    return reply;
}

} // namespace geoupdate
