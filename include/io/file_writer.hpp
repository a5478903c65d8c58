#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <sys/types.h>

namespace geoupdate {

// Creates (or truncates) a regular file and writes it sequentially.
class FileWriter {
  public:
    static Result Open(std::string path, mode_t mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in);
    Result FsyncNow();
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace geoupdate
