#include "net/url.hpp"

namespace geoupdate {

namespace {

bool IsUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string QueryEscape(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (IsUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

std::string EncodeQuery(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out.push_back('&');
        out += QueryEscape(key);
        out.push_back('=');
        out += QueryEscape(value);
    }
    return out;
}

std::string BuildUrl(std::string_view scheme,
                     std::string_view host,
                     std::string_view path,
                     const QueryParams& params) {
    std::string url;
    url.reserve(scheme.size() + host.size() + path.size() + 64);
    url.append(scheme).append("://").append(host);
    if (path.empty() || path.front() != '/') url.push_back('/');
    url.append(path);
    if (!params.empty()) {
        url.push_back('?');
        url += EncodeQuery(params);
    }
    return url;
}

} // namespace geoupdate
