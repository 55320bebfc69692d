#pragma once

#include <atomic>

namespace piprov {

// Set by SIGINT/SIGTERM. Downloads and extraction poll it; the flash write does not.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace piprov
