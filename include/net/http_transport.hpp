#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geoupdate {

struct HttpResponse {
    long status = 0;
    // "<code> <reason>" as sent by the server, e.g. "404 Not Found".
    std::string status_text;
    std::vector<std::uint8_t> body;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    // Any HTTP status is a successful transfer here; only failures to send the
    // request or read the full body are reported, as ErrorKind::Transport.
    virtual Result Get(const std::string& url, HttpResponse& out) = 0;
};

class CurlHttpTransport final : public IHttpTransport {
public:
    struct Options {
        long timeout_seconds = 0; // 0 = no overall timeout
        long connect_timeout_seconds = 30;
        std::uint64_t max_body_bytes = 512ULL * 1024 * 1024;
        std::string user_agent = "geoupdate/1.0";
    };

    CurlHttpTransport();
    explicit CurlHttpTransport(Options opt);

    Result Get(const std::string& url, HttpResponse& out) override;

private:
    Options opt_;
};

} // namespace geoupdate
