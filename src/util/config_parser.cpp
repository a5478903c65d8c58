#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace geoupdate::config {

std::vector<std::string> SplitProductIds(std::string_view csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t end = csv.find(',', start);
        if (end == std::string_view::npos) end = csv.size();
        std::string_view item = csv.substr(start, end - start);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        if (!item.empty()) out.emplace_back(item);
        start = end + 1;
    }
    return out;
}

Result UpdaterConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::ConfigError(err);
    }

    UpdaterConfig merged = *this;
    if (!detail::FillConfigFromJson(json, merged, err)) {
        return Result::ConfigError(err + " in " + path);
    }

    *this = std::move(merged);
    return Result::Ok();
}

Result UpdaterConfig::Validate() const {
    if (protocol != "http" && protocol != "https") {
        return Result::ConfigError("protocol must be http or https (got '" + protocol + "')");
    }
    if (source.empty()) return Result::ConfigError("source host is empty");
    if (directory.empty()) return Result::ConfigError("directory is empty");
    if (user_id.empty()) return Result::ConfigError("user id is empty");
    if (product_ids.empty()) return Result::ConfigError("no product ids given");
    for (const auto& id : product_ids) {
        if (id.empty()) return Result::ConfigError("empty product id");
    }
    return Result::Ok();
}

} // namespace geoupdate::config
