#pragma once

#include "io/io.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/piprov_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string File(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

class MemoryReader final : public piprov::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    // Hands out at most `max_chunk` bytes per Read to exercise short reads.
    void SetMaxChunk(size_t max_chunk) { max_chunk_ = max_chunk; }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        size_t n = std::min(out.size(), data_.size() - pos_);
        if (max_chunk_ != 0)
            n = std::min(n, max_chunk_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
    size_t max_chunk_ = 0;
};

// Records everything written; optionally fails after `fail_after` bytes.
class MemoryWriter final : public piprov::IWriter {
  public:
    std::string data;
    int fsyncs = 0;
    std::optional<size_t> fail_after;

    piprov::Result WriteAll(std::span<const std::uint8_t> in) override {
        if (fail_after && data.size() + in.size() > *fail_after) {
            return piprov::Result::Fail(28, "No space left on device");
        }
        data.append(reinterpret_cast<const char*>(in.data()), in.size());
        return piprov::Result::Ok();
    }

    piprov::Result FsyncNow() override {
        ++fsyncs;
        return piprov::Result::Ok();
    }
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::ostringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

inline bool Exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

// Single-stream compression through libarchive's raw writer.
// `filter` is a libarchive filter name: "xz", "gzip", "bzip2", ...
inline std::string Compress(const std::string& contents, const char* filter) {
    std::vector<std::uint8_t> out(contents.size() + 64 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_raw(a) != ARCHIVE_OK ||
        archive_write_add_filter_by_name(a, filter) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error(std::string("cannot configure ") + filter + " writer");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    archive_entry* hdr = archive_entry_new();
    archive_entry_set_pathname(hdr, "image.img");
    archive_entry_set_filetype(hdr, AE_IFREG);
    archive_entry_set_perm(hdr, 0644);
    archive_entry_set_size(hdr, static_cast<la_int64_t>(contents.size()));
    if (archive_write_header(a, hdr) != ARCHIVE_OK) {
        archive_entry_free(hdr);
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_header failed");
    }
    if (!contents.empty() && archive_write_data(a, contents.data(), contents.size()) < 0) {
        archive_entry_free(hdr);
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_data failed");
    }
    archive_entry_free(hdr);

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), used);
}

inline std::string ReadAll(piprov::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

} // namespace testutil
