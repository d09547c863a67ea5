#pragma once

/**
 * System utilities for the governor
 *
 * Signal handling for the trader process. Linux-specific.
 */

#include "../trading/mode_machine.hpp"

#include <atomic>
#include <csignal>

namespace riskgov {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline trading::KillSwitch* g_kill_switch = nullptr;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Only stores to a lock-free atomic; the main loop reports the shutdown.
 */
inline void graceful_shutdown_handler(int) {
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

inline void kill_switch_handler(int) {
    if (detail::g_kill_switch) {
        detail::g_kill_switch->assert_kill();
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 */
inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

/**
 * Install SIGUSR1 as the out-of-band kill switch.
 */
inline void install_kill_switch_handler(trading::KillSwitch& kill_switch) {
    detail::g_kill_switch = &kill_switch;
    std::signal(SIGUSR1, kill_switch_handler);
}

/**
 * Ignore SIGPIPE so a write to a closed pipe or socket fails with EPIPE
 * instead of terminating the process.
 */
inline void ignore_sigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace util
} // namespace riskgov
