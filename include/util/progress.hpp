#pragma once
#include <cstdint>
#include <string_view>

namespace piprov {

struct ProgressEvent {
    std::string_view stage;   // "download", "extract", "flash", "verify"
    std::uint64_t done = 0;
    std::uint64_t total = 0;  // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace piprov
