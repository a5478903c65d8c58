#include "util/result.hpp"

namespace geoupdate {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:      return "ok";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::Protocol:  return "protocol error";
        case ErrorKind::Io:        return "io error";
        case ErrorKind::Config:    return "config error";
    }
    return "error";
}

} // namespace geoupdate
