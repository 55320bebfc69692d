#include "util/progress_sinks.hpp"

#include <cinttypes>
#include <cstdio>

namespace piprov {

namespace {
bool g_progress_line_active = false;

constexpr double kMiB = 1024.0 * 1024.0;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const auto now = std::chrono::steady_clock::now();
    const bool finished = e.total > 0 && e.done >= e.total;

    if (stage_ != e.stage) {
        stage_.assign(e.stage);
        stage_start_ = now;
        last_draw_ = {};
    } else if (!finished && now - last_draw_ < min_interval_) {
        return;
    }
    last_draw_ = now;

    double elapsed = std::chrono::duration<double>(now - stage_start_).count();
    if (elapsed <= 0.0)
        elapsed = 0.001;
    const double mib_s = (static_cast<double>(e.done) / kMiB) / elapsed;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% (%" PRIu64 "/%" PRIu64 " bytes) %.1f MiB/s ",
                     static_cast<int>(e.stage.size()),
                     e.stage.data(),
                     pct,
                     e.done,
                     e.total,
                     mib_s);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %" PRIu64 " bytes %.1f MiB/s ",
                     static_cast<int>(e.stage.size()),
                     e.stage.data(),
                     e.done,
                     mib_s);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (finished) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace piprov
