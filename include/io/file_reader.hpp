#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace piprov {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    // Stops after `limit` bytes; used to read back an image-sized prefix of a device.
    void SetLimit(std::uint64_t limit) { limit_ = limit; }

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::optional<std::uint64_t> limit_;
    std::uint64_t consumed_ = 0;
};

} // namespace piprov
