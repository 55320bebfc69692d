#pragma once

#include "util/progress.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace piprov {

// Lower-cases a hex digest for comparison.
std::string NormalizeHex(std::string_view hex);
bool IsSha256Hex(std::string_view hex);

// A sidecar's first whitespace-delimited token is the expected digest
// ("<hex>  <filename>" as written by sha256sum).
Result ParseSidecarDigest(std::string_view sidecar_text, std::string& out_hex);
Result ReadSidecarDigestFile(const std::string& path, std::string& out_hex);

class ChecksumVerifier {
public:
    explicit ChecksumVerifier(IProgress* progress = nullptr) : progress_(progress) {}

    // ChecksumMismatch when the digests differ, Io when the file cannot be hashed.
    Result VerifyFile(const std::string& path, const std::string& expected_hex) const;

private:
    IProgress* progress_ = nullptr;
};

} // namespace piprov
