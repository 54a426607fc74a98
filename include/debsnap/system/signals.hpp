#pragma once

#include "debsnap/util/result.hpp"

#include <atomic>

namespace debsnap {

// Set from SIGINT/SIGTERM. Workers finish the item in hand, then stop
// taking new ones.
extern std::atomic_bool g_cancel;

// SIGINT and SIGTERM request cancellation instead of killing the process,
// so a half-written pool file or source list is never left behind.
Result InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

// Signal number behind the last cancellation request, 0 when none.
int CancelSignal();

} // namespace debsnap
