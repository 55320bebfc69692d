#include "io/pending_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace piprov {

PendingFile::PendingFile(std::string final_path)
    : final_path_(std::move(final_path)), temp_path_(final_path_ + ".tmp") {
    ::unlink(temp_path_.c_str());
}

PendingFile::~PendingFile() { Discard(); }

Result PendingFile::Commit() {
    if (settled_) return Result::Ok();
    if (std::rename(temp_path_.c_str(), final_path_.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(err, "rename " + temp_path_ + " -> " + final_path_ + " failed (" +
                                     std::strerror(err) + ")");
    }
    settled_ = true;
    return Result::Ok();
}

void PendingFile::Discard() {
    if (!settled_) {
        ::unlink(temp_path_.c_str());
        settled_ = true;
    }
}

} // namespace piprov
