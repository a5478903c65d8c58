#include "util/config_json_utils.hpp"

#include "util/duration.hpp"

#include <fstream>

namespace geoupdate::config::detail {

namespace {

// Each getter returns false only for a present key of the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetProductIdsIfPresent(const nlohmann::json& j, std::vector<std::string>& out, std::string& err) {
    auto it = j.find("ProductIds");
    if (it == j.end())
        return true;
    if (it->is_string()) {
        out = SplitProductIds(it->get<std::string>());
        return true;
    }
    if (!it->is_array()) {
        err = "'ProductIds' must be an array of strings or a comma-delimited string";
        return false;
    }
    std::vector<std::string> ids;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = "'ProductIds' entries must be strings";
            return false;
        }
        ids.push_back(item.get<std::string>());
    }
    out = std::move(ids);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "Source", cfg.source, err) ||
        !GetStringIfPresent(j, "Protocol", cfg.protocol, err) ||
        !GetStringIfPresent(j, "Directory", cfg.directory, err) ||
        !GetStringIfPresent(j, "UserId", cfg.user_id, err) ||
        !GetStringIfPresent(j, "LicenseKey", cfg.license_key, err) ||
        !GetProductIdsIfPresent(j, cfg.product_ids, err) ||
        !GetBoolIfPresent(j, "Links", cfg.links, err) ||
        !GetU64IfPresent(j, "TimeoutSeconds", cfg.timeout_seconds, err)) {
        return false;
    }

    std::string delay;
    if (!GetStringIfPresent(j, "RandomDelay", delay, err))
        return false;
    if (!delay.empty()) {
        auto parsed = ParseDuration(delay);
        if (!parsed) {
            err = "'RandomDelay': " + parsed.error();
            return false;
        }
        cfg.random_delay = *parsed;
    }

    return true;
}

} // namespace geoupdate::config::detail
