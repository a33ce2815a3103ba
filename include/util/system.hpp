#pragma once

/**
 * Process shutdown on SIGINT/SIGTERM
 *
 * The handler only stores into atomics. The main thread blocks in
 * wait_for_shutdown() and does the actual teardown (cancel replays,
 * close the live feed, stop servers) once the running flag drops.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace zonetrader {
namespace util {

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline std::atomic<int> g_shutdown_signal{0};
} // namespace detail

inline void on_shutdown_signal(int sig) {
    detail::g_shutdown_signal.store(sig, std::memory_order_relaxed);
    if (detail::g_running_flag)
        detail::g_running_flag->store(false);
}

inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, on_shutdown_signal);
    std::signal(SIGTERM, on_shutdown_signal);
}

// Signal that ended the run, 0 when shutdown came from inside the process
inline int shutdown_signal() { return detail::g_shutdown_signal.load(std::memory_order_relaxed); }

inline const char* signal_name(int sig) {
    switch (sig) {
    case 0:
        return "none";
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "signal";
    }
}

inline void wait_for_shutdown(const std::atomic<bool>& running,
                              std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
    while (running.load())
        std::this_thread::sleep_for(poll);
}

} // namespace util
} // namespace zonetrader
