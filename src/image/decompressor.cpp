#include "image/decompressor.hpp"

#include "io/archive_stream_reader.hpp"
#include "io/counting_reader.hpp"
#include "io/device_writer.hpp"
#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "io/pending_file.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/string_utils.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>
#include <vector>

namespace piprov {

namespace {

Result Pump(IReader& src, DeviceWriter& out, std::uint64_t& written) {
    std::vector<std::uint8_t> buf(Decompressor::kChunkSize);
    for (;;) {
        if (CancelRequested()) {
            return Result::Fail(ErrorKind::Extraction, ECANCELED, "extraction cancelled");
        }
        const ssize_t n = src.Read(buf);
        if (n < 0) {
            return Result::Fail(ErrorKind::Extraction, EIO, "corrupt or truncated compressed stream");
        }
        if (n == 0) break;
        auto r = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(n)));
        if (!r.ok) return r.As(ErrorKind::Extraction);
        written += static_cast<std::uint64_t>(n);
    }
    return Result::Ok();
}

} // namespace

Result Decompressor::Extract(const std::string& compressed_path,
                             const std::string& output_path) const {
    auto file = std::make_unique<FileReader>();
    auto r = FileReader::Open(compressed_path, *file);
    if (!r.ok) return r.As(ErrorKind::Extraction);

    // Progress tracks compressed bytes consumed; the decompressed size is unknown up front.
    auto counted = std::make_unique<CountingReader>(std::move(file), progress_, "extract");

    std::unique_ptr<IReader> decoded;
    std::unique_ptr<ArchiveStreamReader> archive;
    if (EndsWith(ToLower(compressed_path), ".gz")) {
        try {
            decoded = std::make_unique<GzipReader>(std::move(counted));
        } catch (const std::exception& ex) {
            return Result::Fail(ErrorKind::Extraction, ex.what());
        }
    } else {
        archive = std::make_unique<ArchiveStreamReader>();
        r = archive->Open(*counted);
        if (!r.ok) return r.As(ErrorKind::Extraction);
    }
    IReader& src = decoded ? *decoded : static_cast<IReader&>(*archive);

    LogInfo("Decompressing %s -> %s", compressed_path.c_str(), output_path.c_str());

    PendingFile pending(output_path);
    DeviceWriter out;
    r = DeviceWriter::Open(pending.TempPath(), out);
    if (!r.ok) return r.As(ErrorKind::Extraction);

    std::uint64_t written = 0;
    r = Pump(src, out, written);
    if (!r.ok) {
        if (archive && !archive->LastError().empty()) {
            r.msg += ": " + archive->LastError();
        }
        return r;
    }
    if (written == 0) {
        return Result::Fail(ErrorKind::Extraction, "decompressed image is empty");
    }

    r = out.FsyncNow();
    if (!r.ok) return r.As(ErrorKind::Extraction);
    r = out.Close();
    if (!r.ok) return r.As(ErrorKind::Extraction);

    r = pending.Commit();
    if (!r.ok) return r.As(ErrorKind::Extraction);

    LogInfo("Decompressed %s (%s)", output_path.c_str(), HumanSize(written).c_str());
    return Result::Ok();
}

} // namespace piprov
