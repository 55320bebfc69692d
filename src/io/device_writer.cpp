// device_writer.cpp - Writer implementation for whole-disk device nodes and plain files.

#include "io/device_writer.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace piprov {

Result DeviceWriter::Open(std::string path, DeviceWriter& out) {
    out.path_ = std::move(path);

    int flags = O_WRONLY | O_CLOEXEC;
    if (!IsDevPath(out.path_)) {
        flags |= O_CREAT | O_TRUNC;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result DeviceWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = (n == 0) ? ENOSPC : errno;
        return Result::Fail(err, "Write to " + path_ + " failed (" + std::strerror(err) + ")");
    }

    return Result::Ok();
}

Result DeviceWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(err, "fsync " + path_ + " failed (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result DeviceWriter::Close() {
    if (!fd_.Valid())
        return Result::Ok();
    if (fd_.Close() != 0) {
        const int err = errno;
        return Result::Fail(err, "close " + path_ + " failed (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace piprov
