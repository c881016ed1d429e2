#include "exit_hook.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>

#ifdef _WIN32
#  include <io.h>
#else
#  include <signal.h>
#  include <unistd.h>
#endif

namespace platform {

// ── Normal exit ──────────────────────────────────────────────

namespace {

std::mutex g_exit_mutex;
std::map<int, std::function<void()>> g_exit_cleanups;
int g_next_exit_id = 1;
std::once_flag g_atexit_once;

void atexit_trampoline() {
    run_exit_cleanups();
}

} // namespace

int register_exit_cleanup(std::function<void()> fn) {
    std::call_once(g_atexit_once, [] { std::atexit(atexit_trampoline); });
    std::lock_guard<std::mutex> lock(g_exit_mutex);
    int id = g_next_exit_id++;
    g_exit_cleanups[id] = std::move(fn);
    return id;
}

void unregister_exit_cleanup(int id) {
    std::lock_guard<std::mutex> lock(g_exit_mutex);
    g_exit_cleanups.erase(id);
}

void run_exit_cleanups() {
    std::map<int, std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(g_exit_mutex);
        pending.swap(g_exit_cleanups);
    }
    for (auto& [id, fn] : pending) {
        if (fn) fn();
    }
}

// ── Signals ──────────────────────────────────────────────────

namespace {

constexpr int kSignalSlots = 4;
constexpr int kMaxPath = 4096;

char g_signal_paths[kSignalSlots][kMaxPath];
volatile std::sig_atomic_t g_signal_used[kSignalSlots] = {0, 0, 0, 0};
std::mutex g_signal_mutex;
bool g_handlers_installed = false;

const int kSignals[] = {
    SIGINT,
    SIGTERM,
#ifndef _WIN32
    SIGHUP,
#endif
};

#ifndef _WIN32
struct sigaction g_old_actions[sizeof(kSignals) / sizeof(kSignals[0])];
#endif

void unlink_registered() {
    for (int i = 0; i < kSignalSlots; ++i) {
        if (g_signal_used[i]) {
#ifdef _WIN32
            _unlink(g_signal_paths[i]);
#else
            unlink(g_signal_paths[i]);
#endif
        }
    }
}

#ifdef _WIN32

using SignalHandler = void (*)(int);
SignalHandler g_old_handlers[sizeof(kSignals) / sizeof(kSignals[0])];

void termination_handler(int sig) {
    SignalHandler old = SIG_DFL;
    for (size_t i = 0; i < sizeof(kSignals) / sizeof(kSignals[0]); ++i) {
        if (kSignals[i] == sig) old = g_old_handlers[i];
    }
    if (old == SIG_IGN) {
        std::signal(sig, termination_handler);
        return;
    }
    if (old != SIG_DFL && old != SIG_ERR) {
        // The embedder handles it and the process may live on: keep the file.
        std::signal(sig, termination_handler);
        old(sig);
        return;
    }
    unlink_registered();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

void install_handlers() {
    for (size_t i = 0; i < sizeof(kSignals) / sizeof(kSignals[0]); ++i) {
        g_old_handlers[i] = std::signal(kSignals[i], termination_handler);
    }
}

#else

void termination_handler(int sig, siginfo_t* info, void* context) {
    size_t slot = 0;
    while (slot < sizeof(kSignals) / sizeof(kSignals[0]) && kSignals[slot] != sig) ++slot;
    const struct sigaction& old = g_old_actions[slot];

    // The lock file only goes when the signal really kills the process. A
    // process that survives still holds the instance lock, and a new file at
    // the path would let a second leader in.
    if (old.sa_flags & SA_SIGINFO) {
        old.sa_sigaction(sig, info, context);
        return;
    }
    if (old.sa_handler == SIG_IGN) return;
    if (old.sa_handler != SIG_DFL) {
        old.sa_handler(sig);
        return;
    }

    unlink_registered();
    sigaction(sig, &old, nullptr);
    raise(sig);
}

void install_handlers() {
    struct sigaction sa;
    sa.sa_sigaction = termination_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO;
    for (size_t i = 0; i < sizeof(kSignals) / sizeof(kSignals[0]); ++i) {
        sigaction(kSignals[i], &sa, &g_old_actions[i]);
    }
}

#endif

} // namespace

int register_signal_cleanup(const std::string& path) {
    if (path.size() >= static_cast<size_t>(kMaxPath)) return -1;

    std::lock_guard<std::mutex> lock(g_signal_mutex);
    for (int i = 0; i < kSignalSlots; ++i) {
        if (g_signal_used[i]) continue;
        std::memcpy(g_signal_paths[i], path.c_str(), path.size() + 1);
        g_signal_used[i] = 1;
        if (!g_handlers_installed) {
            install_handlers();
            g_handlers_installed = true;
        }
        return i;
    }
    return -1;
}

void clear_signal_cleanup(int slot) {
    if (slot < 0 || slot >= kSignalSlots) return;
    std::lock_guard<std::mutex> lock(g_signal_mutex);
    g_signal_used[slot] = 0;
}

} // namespace platform
