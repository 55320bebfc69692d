#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace piprov {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(256 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && !source_drained_) {
            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                source_drained_ = true;
            } else {
                strm_.avail_in = static_cast<uInt>(n);
                strm_.next_in = in_buffer_.data();
            }
        }

        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR only means "no progress possible right now".
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }

        if (source_drained_ && strm_.avail_in == 0 && ret == Z_BUF_ERROR) {
            break;
        }
    }

    const size_t produced = out.size() - strm_.avail_out;
    if (produced == 0 && !eof_reached_) {
        // Input ended before the gzip trailer: truncated stream.
        return -1;
    }
    return static_cast<ssize_t>(produced);
}

} // namespace piprov
