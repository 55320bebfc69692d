#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace piprov {

// Decodes a single-file compressed stream (xz, bzip2, zstd, lz4, ...) with
// libarchive's "raw" format, exposing the decompressed bytes as an IReader.
class ArchiveStreamReader final : public IReader {
public:
    ArchiveStreamReader() = default;
    ~ArchiveStreamReader() override;

    ArchiveStreamReader(const ArchiveStreamReader&) = delete;
    ArchiveStreamReader& operator=(const ArchiveStreamReader&) = delete;

    // `src` must outlive this reader.
    Result Open(IReader& src);

    ssize_t Read(std::span<std::uint8_t> out) override;

    // Name of the outermost filter libarchive detected ("xz", "bzip2", "none", ...).
    const std::string& FilterName() const { return filter_name_; }
    const std::string& LastError() const { return last_error_; }

private:
    struct SourceCtx {
        IReader* reader = nullptr;
        std::vector<std::uint8_t> buf;
    };

    std::string ErrorString() const;

    struct archive* ar_ = nullptr;
    std::unique_ptr<SourceCtx> ctx_;
    std::string filter_name_;
    std::string last_error_;
    bool eof_ = false;
};

} // namespace piprov
