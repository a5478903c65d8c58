#include "update/publisher.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <cstdio>
#include <unistd.h>

namespace geoupdate {

namespace {

Result AsIoError(Result r) {
    r.kind = ErrorKind::Io;
    return r;
}

void DiscardStaging(const std::string& tmp_path) {
    if (::unlink(tmp_path.c_str()) != 0 && errno != ENOENT) {
        LogWarn("Cannot remove %s: %s", tmp_path.c_str(), std::strerror(errno));
    }
}

} // namespace

Result AtomicPublisher::Stage(const std::string& target_path,
                              std::span<const std::uint8_t> data) const {
    if (target_path.empty()) {
        return Result::Fail(ErrorKind::Io, EINVAL, "publish target path is empty");
    }

    const std::string tmp_path = StagingPath(target_path);

    FileWriter writer;
    auto open_res = FileWriter::Open(tmp_path, mode_, writer);
    if (!open_res.is_ok()) return AsIoError(open_res);

    auto res = writer.WriteAll(data);
    if (res.is_ok()) res = writer.FsyncNow();
    if (res.is_ok()) res = writer.Close();
    if (!res.is_ok()) {
        (void)writer.Close();
        DiscardStaging(tmp_path);
        return AsIoError(res);
    }

    LogDebug("Staged %zu bytes at %s", data.size(), tmp_path.c_str());
    return Result::Ok();
}

Result AtomicPublisher::Commit(const std::string& target_path) const {
    const std::string tmp_path = StagingPath(target_path);
    if (::rename(tmp_path.c_str(), target_path.c_str()) != 0) {
        const int err = errno;
        DiscardStaging(tmp_path);
        return Result::Fail(ErrorKind::Io, err,
                            "Atomic rename " + tmp_path + " -> " + target_path +
                                " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

Result AtomicPublisher::Publish(const std::string& target_path,
                                std::span<const std::uint8_t> data) const {
    auto stage_res = Stage(target_path, data);
    if (!stage_res.is_ok()) return stage_res;
    return Commit(target_path);
}

} // namespace geoupdate
