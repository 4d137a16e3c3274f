#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace updater {

// Regular-file writer; Open creates or truncates.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out, mode_t mode = 0644);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace updater
