#include "debsnap/system/signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace debsnap {

std::atomic_bool g_cancel{false};

namespace {

volatile std::sig_atomic_t g_signal = 0;

void OnCancelSignal(int sig) {
    g_signal = sig;
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

Result InstallSignalHandlers() {
    for (int sig : {SIGINT, SIGTERM}) {
        if (std::signal(sig, OnCancelSignal) == SIG_ERR) {
            const int e = errno;
            return Result::Fail(e, "cannot handle signal " + std::to_string(sig) + ": " + std::strerror(e));
        }
    }
    return Result::Ok();
}

int CancelSignal() { return static_cast<int>(g_signal); }

} // namespace debsnap
