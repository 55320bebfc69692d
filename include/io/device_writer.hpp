#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace piprov {

// Writer for a block/character device node or a regular file.
// Device nodes are opened without O_CREAT/O_TRUNC; regular files are created or truncated.
class DeviceWriter final : public IWriter {
  public:
    static Result Open(std::string path, DeviceWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace piprov
