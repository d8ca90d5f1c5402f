// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <csignal>

namespace uploader {

std::atomic_bool g_cancel{false};

namespace {

std::atomic<pid_t> g_child_pgid{0};

static_assert(std::atomic<pid_t>::is_always_lock_free);

void HandleSignal(int sig) {
    if (!g_cancel.exchange(true, std::memory_order_relaxed)) return;

    const pid_t pgid = g_child_pgid.load(std::memory_order_relaxed);
    if (pgid > 0) ::kill(-pgid, sig);

    // |sig| stays blocked until the handler returns, then the default action runs.
    ::signal(sig, SIG_DFL);
    ::raise(sig);
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking poll() on a child's output returns EINTR and
    // the runner retries it, so the in-flight command still completes.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

void SetForegroundChild(pid_t pgid) {
    g_child_pgid.store(pgid, std::memory_order_relaxed);
}

} // namespace uploader
