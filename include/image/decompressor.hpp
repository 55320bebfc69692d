#pragma once

#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>

namespace piprov {

// Turns a compressed image (.xz, .gz, or anything libarchive's raw format reads)
// into a raw disk image. The output appears only once fully written.
class Decompressor {
public:
    static constexpr std::size_t kChunkSize = 4 * 1024 * 1024;

    explicit Decompressor(IProgress* progress = nullptr) : progress_(progress) {}

    // Failures are ErrorKind::Extraction; a cancelled run leaves no output behind.
    Result Extract(const std::string& compressed_path, const std::string& output_path) const;

private:
    IProgress* progress_ = nullptr;
};

} // namespace piprov
