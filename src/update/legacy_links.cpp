#include "update/legacy_links.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace geoupdate {

std::vector<std::string> CreateLegacyLinks(const std::string& directory) {
    LogInfo("Making legacy links in %s", directory.c_str());

    std::vector<std::string> created;
    for (const auto& link : kLegacyLinks) {
        const std::string target = JoinPath(directory, link.target_name);
        const std::string name = JoinPath(directory, link.link_name);
        if (::symlink(target.c_str(), name.c_str()) != 0) {
            if (errno == EEXIST) {
                LogDebug("Legacy link %s already exists", name.c_str());
            } else {
                LogWarn("Cannot create legacy link %s -> %s: %s",
                        name.c_str(), target.c_str(), std::strerror(errno));
            }
            continue;
        }
        created.push_back(name);
    }
    return created;
}

} // namespace geoupdate
