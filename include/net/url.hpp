#pragma once

#include <map>
#include <string>
#include <string_view>

namespace geoupdate {

using QueryParams = std::map<std::string, std::string>;

// application/x-www-form-urlencoded escaping: unreserved characters are kept,
// space becomes '+', everything else is %XX (uppercase hex).
std::string QueryEscape(std::string_view s);

// "k1=v1&k2=v2" with keys in sorted order.
std::string EncodeQuery(const QueryParams& params);

// scheme://host/path[?query]
std::string BuildUrl(std::string_view scheme,
                     std::string_view host,
                     std::string_view path,
                     const QueryParams& params = {});

} // namespace geoupdate
