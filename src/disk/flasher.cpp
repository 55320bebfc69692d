#include "disk/flasher.hpp"

#include "crypto/sha256.hpp"
#include "io/counting_reader.hpp"
#include "io/device_writer.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <unistd.h>
#include <vector>

namespace piprov {

namespace {

// Fills `buf` unless the reader runs dry first. -1 on read error.
ssize_t ReadFull(IReader& reader, std::span<std::uint8_t> buf) {
    std::size_t got = 0;
    while (got < buf.size()) {
        const ssize_t n = reader.Read(buf.subspan(got));
        if (n < 0) return -1;
        if (n == 0) break;
        got += static_cast<std::size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

} // namespace

Flasher::Flasher(DiskInventory& inventory, Options opt) : inventory_(inventory), opt_(opt) {
    if (opt_.block_size == 0 || opt_.block_size % kSectorSize != 0) {
        opt_.block_size = 4 * 1024 * 1024;
    }
}

Result Flasher::Copy(IReader& reader, IWriter& writer, FlashReport& report) const {
    std::vector<std::uint8_t> buf(opt_.block_size);
    Sha256Hasher hasher;

    const auto total = reader.TotalSize();
    const auto t0 = std::chrono::steady_clock::now();

    report.image_bytes = 0;
    report.written_bytes = 0;

    for (;;) {
        const ssize_t n = ReadFull(reader, buf);
        if (n < 0) {
            const int err = errno;
            return Result::Fail(ErrorKind::Flash, err,
                                "read failed (" + std::string(std::strerror(err)) + ")");
        }
        if (n == 0) break;

        std::size_t len = static_cast<std::size_t>(n);
        hasher.Update(std::span<const std::uint8_t>(buf.data(), len));
        report.image_bytes += len;

        if (len % kSectorSize != 0) {
            const std::size_t padded = (len / kSectorSize + 1) * kSectorSize;
            std::fill(buf.begin() + static_cast<std::ptrdiff_t>(len),
                      buf.begin() + static_cast<std::ptrdiff_t>(padded), std::uint8_t{0});
            len = padded;
        }

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), len));
        if (!wr.ok) return wr.As(ErrorKind::Flash);
        report.written_bytes += len;

        if (opt_.progress) {
            opt_.progress->OnProgress(
                {.stage = "flash", .done = report.image_bytes, .total = total.value_or(0)});
        }
        if (static_cast<std::size_t>(n) < buf.size()) break;
    }
    if (report.image_bytes == 0) {
        return Result::Fail(ErrorKind::Flash, "image is empty");
    }

    auto fs = writer.FsyncNow();
    if (!fs.ok) return fs.As(ErrorKind::Flash);

    report.sha256 = hasher.FinalHex();
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
    report.seconds = elapsed.count();
    return Result::Ok();
}

Result Flasher::VerifyReadBack(const std::string& device_path, const FlashReport& report) const {
    LogInfo("Verifying %s against the written image", device_path.c_str());

    auto file = std::make_unique<FileReader>();
    auto r = FileReader::Open(device_path, *file);
    if (!r.ok) return r.As(ErrorKind::Flash);
    file->SetLimit(report.image_bytes);

    CountingReader counted(std::move(file), opt_.progress, "verify");
    const std::string actual = Sha256Hex(counted);
    if (actual.empty()) {
        return Result::Fail(ErrorKind::Flash, "cannot read back " + device_path);
    }
    if (counted.BytesRead() != report.image_bytes) {
        return Result::Fail(ErrorKind::Flash, "short read back from " + device_path);
    }
    if (actual != report.sha256) {
        return Result::Fail(ErrorKind::Flash,
                            "verification failed: device sha256 " + actual + " != image sha256 " +
                                report.sha256);
    }
    LogInfo("Verification OK.");
    return Result::Ok();
}

Result Flasher::Flash(FlashJob& job, FlashReport& report) {
    const DiskDevice& disk = job.target.Disk();

    // Mounts can appear while the operator reads the prompt; unmount what is there now.
    DiskDevice current;
    auto r = inventory_.Describe(disk.identifier, current);
    if (!r.ok) return r.As(ErrorKind::Flash);
    if (current.size_bytes != disk.size_bytes) {
        return Result::Fail(ErrorKind::Flash,
                            disk.identifier + " changed since it was validated (" +
                                HumanSize(disk.size_bytes) + " -> " + HumanSize(current.size_bytes) + ")");
    }
    r = inventory_.UnmountDisk(current);
    if (!r.ok) return r.As(ErrorKind::Flash);

    FileReader image;
    r = FileReader::Open(job.image_path, image);
    if (!r.ok) return r.As(ErrorKind::Flash);

    DeviceWriter writer;
    job.device_path = inventory_.RawDevicePath(disk);
    r = DeviceWriter::Open(job.device_path, writer);
    if (!r.ok && job.device_path != disk.path) {
        LogWarn("Cannot open %s (%s), falling back to %s", job.device_path.c_str(), r.msg.c_str(),
                disk.path.c_str());
        job.device_path = disk.path;
        r = DeviceWriter::Open(job.device_path, writer);
    }
    if (!r.ok) return r.As(ErrorKind::Flash);

    LogInfo("Writing %s to %s (block size %s)", job.image_path.c_str(), job.device_path.c_str(),
            HumanSize(opt_.block_size).c_str());

    r = Copy(image, writer, report);
    if (!r.ok) return r;
    r = writer.Close();
    if (!r.ok) return r.As(ErrorKind::Flash);
    ::sync();

    const double sec = report.seconds > 0.0 ? report.seconds : 0.001;
    LogInfo("Flash complete: %s in %.1fs (%.1f MiB/s)", HumanSize(report.image_bytes).c_str(), sec,
            static_cast<double>(report.image_bytes) / (1024.0 * 1024.0) / sec);

    r = inventory_.RescanPartitions(disk.path);
    if (!r.ok) LogWarn("Partition table rescan failed: %s", r.msg.c_str());

    if (opt_.verify) {
        r = VerifyReadBack(job.device_path, report);
        if (!r.ok) return r;
    }
    return Result::Ok();
}

} // namespace piprov
