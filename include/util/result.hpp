#pragma once
#include <string>
#include <utility>

namespace geoupdate {

enum class ErrorKind : int {
    None      = 0,
    Transport = 1,
    Protocol  = 2,
    Io        = 3,
    Config    = 4,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::Io};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }

    static Result TransportError(std::string m) { return Fail(ErrorKind::Transport, -1, std::move(m)); }
    static Result ProtocolError(std::string m) { return Fail(ErrorKind::Protocol, -1, std::move(m)); }
    static Result ConfigError(std::string m) { return Fail(ErrorKind::Config, -1, std::move(m)); }
};

} // namespace geoupdate
