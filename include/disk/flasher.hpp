#pragma once

#include "disk/disk_inventory.hpp"
#include "disk/safety_validator.hpp"
#include "io/io.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace piprov {

inline constexpr std::size_t kSectorSize = 512;

struct FlashReport {
    std::uint64_t image_bytes = 0;
    std::uint64_t written_bytes = 0; // image_bytes rounded up to a whole sector
    std::string sha256;
    double seconds = 0.0;
};

class Flasher {
public:
    struct Options {
        std::size_t block_size = 4 * 1024 * 1024;
        bool verify = false;
        IProgress* progress = nullptr;
    };

    Flasher(DiskInventory& inventory, Options opt);

    // Unmount, write, sync, rescan, optionally read back. Failures are ErrorKind::Flash.
    Result Flash(FlashJob& job, FlashReport& report);

    // The bulk copy alone: `reader` to `writer` in block_size chunks, final chunk
    // zero-padded to a sector boundary, hashing the unpadded bytes.
    Result Copy(IReader& reader, IWriter& writer, FlashReport& report) const;

private:
    Result VerifyReadBack(const std::string& device_path, const FlashReport& report) const;

    DiskInventory& inventory_;
    Options opt_;
};

} // namespace piprov
