#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <sys/types.h>

namespace geoupdate {

// Write-to-temp-then-rename publication of a database file. The target path
// is either untouched or fully replaced, never partially written.
class AtomicPublisher {
public:
    static constexpr mode_t kDefaultMode = 0644;

    explicit AtomicPublisher(mode_t mode = kDefaultMode) : mode_(mode) {}

    static std::string StagingPath(const std::string& target_path) { return target_path + ".tmp"; }

    Result Publish(const std::string& target_path, std::span<const std::uint8_t> data) const;

    // First half of Publish: writes and fsyncs StagingPath(target_path).
    Result Stage(const std::string& target_path, std::span<const std::uint8_t> data) const;
    // Second half of Publish: renames the staged file over target_path.
    Result Commit(const std::string& target_path) const;

private:
    mode_t mode_;
};

} // namespace geoupdate
