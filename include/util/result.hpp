#pragma once
#include <string>
#include <utility>

namespace piprov {

enum class ErrorKind : int {
    None = 0,
    Resolution,
    AssetNotFound,
    InsufficientSpace,
    Download,
    ChecksumMismatch,
    Extraction,
    DiskNotFound,
    UnsafeTarget,
    UserAborted,
    Flash,
    MountTimeout,
    Config,
    Io,
    Usage,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .kind = ErrorKind::Io, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .err = -1, .kind = k, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .kind = k, .msg = std::move(m)};
    }

    // Keeps errno and message, re-labels the failure for the calling stage.
    Result As(ErrorKind k) const {
        Result r = *this;
        r.kind = k;
        return r;
    }
};

} // namespace piprov
