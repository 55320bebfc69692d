#pragma once

#include "util/progress.hpp"

#include <chrono>
#include <string>

namespace piprov {

// Single-line progress on stderr, redrawn at most every `min_interval`.
class ConsoleProgressSink final : public IProgress {
  public:
    explicit ConsoleProgressSink(std::chrono::milliseconds min_interval = std::chrono::milliseconds(500))
        : min_interval_(min_interval) {}

    void OnProgress(const ProgressEvent& e) override;

  private:
    std::chrono::milliseconds min_interval_;
    std::chrono::steady_clock::time_point last_draw_{};
    std::chrono::steady_clock::time_point stage_start_{};
    std::string stage_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace piprov
