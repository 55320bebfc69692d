#include "crypto/checksum_verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace piprov {

std::string NormalizeHex(std::string_view hex) { return ToLower(Trim(hex)); }

bool IsSha256Hex(std::string_view hex) {
    if (hex.size() != 64) return false;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result ParseSidecarDigest(std::string_view sidecar_text, std::string& out_hex) {
    const std::string token = FirstToken(sidecar_text);
    if (token.empty()) {
        return Result::Fail(ErrorKind::Download, "digest sidecar is empty");
    }
    if (!IsSha256Hex(token)) {
        return Result::Fail(ErrorKind::Download, "digest sidecar does not start with a SHA-256 hex digest");
    }
    out_hex = NormalizeHex(token);
    return Result::Ok();
}

Result ReadSidecarDigestFile(const std::string& path, std::string& out_hex) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Io, "cannot open digest sidecar " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    auto r = ParseSidecarDigest(ss.str(), out_hex);
    if (!r.ok) r.msg += " (" + path + ")";
    return r;
}

Result ChecksumVerifier::VerifyFile(const std::string& path, const std::string& expected_hex) const {
    LogInfo("Calculating SHA256 of %s", path.c_str());

    std::string actual;
    auto r = Sha256HexFile(path, actual, progress_);
    if (!r.ok) return r.As(ErrorKind::Io);

    LogDebug("Expected: %s", expected_hex.c_str());
    LogDebug("Actual:   %s", actual.c_str());

    if (NormalizeHex(actual) != NormalizeHex(expected_hex)) {
        return Result::Fail(ErrorKind::ChecksumMismatch,
                            "sha256 mismatch for " + path + ": expected=" + expected_hex +
                                " actual=" + actual);
    }
    return Result::Ok();
}

} // namespace piprov
