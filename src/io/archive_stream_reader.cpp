#include "io/archive_stream_reader.hpp"

#include <archive_entry.h>

namespace piprov {

ArchiveStreamReader::~ArchiveStreamReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

std::string ArchiveStreamReader::ErrorString() const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return em ? std::string(em) : std::string("unknown");
}

Result ArchiveStreamReader::Open(IReader& src) {
    if (ar_) return Result::Fail(-1, "Stream already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar_);
    archive_read_support_format_raw(ar_);

    ctx_ = std::make_unique<SourceCtx>();
    ctx_->reader = &src;
    ctx_->buf.resize(256 * 1024);

    auto read_cb = [](archive*, void* cd, const void** buff) -> la_ssize_t {
        auto* c = static_cast<SourceCtx*>(cd);
        const ssize_t n = c->reader->Read(std::span<std::uint8_t>(c->buf.data(), c->buf.size()));
        if (n < 0) return -1;
        *buff = c->buf.data();
        return static_cast<la_ssize_t>(n); // 0 => EOF
    };

    if (archive_read_open2(ar_, ctx_.get(), /*open*/nullptr, read_cb, /*skip*/nullptr,
                           /*close*/nullptr) != ARCHIVE_OK) {
        const std::string em = ErrorString();
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(-1, "archive_read_open2 failed: " + em);
    }

    struct archive_entry* entry = nullptr;
    const int r = archive_read_next_header(ar_, &entry);
    if (r != ARCHIVE_OK) {
        const std::string em = ErrorString();
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(-1, "cannot decode compressed stream: " + em);
    }

    const char* filter = archive_filter_name(ar_, 0);
    filter_name_ = filter ? filter : "none";
    return Result::Ok();
}

ssize_t ArchiveStreamReader::Read(std::span<std::uint8_t> out) {
    if (!ar_) return -1;
    if (eof_ || out.empty()) return 0;

    const la_ssize_t n = archive_read_data(ar_, out.data(), out.size());
    if (n < 0) {
        last_error_ = ErrorString();
        return -1;
    }
    if (n == 0) eof_ = true;
    return static_cast<ssize_t>(n);
}

} // namespace piprov
