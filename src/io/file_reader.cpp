#include "io/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace piprov {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.limit_.reset();
    out.consumed_ = 0;

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const {
    if (limit_) {
        return size_ ? std::min(*size_, *limit_) : *limit_;
    }
    return size_;
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    size_t want = out.size();
    if (limit_) {
        if (consumed_ >= *limit_)
            return 0;
        want = static_cast<size_t>(std::min<std::uint64_t>(want, *limit_ - consumed_));
    }
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), want);
        if (n >= 0) {
            consumed_ += static_cast<std::uint64_t>(n);
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace piprov
