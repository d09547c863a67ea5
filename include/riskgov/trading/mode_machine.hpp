#pragma once

/**
 * Mode State Machine - PAPER / LIVE_LIMITED / HALTED
 *
 * Evaluated once per cycle, before the Governor sees the cycle's signal.
 *
 * Transitions:
 * - any -> HALTED            hard stop-loss tripped, or kill switch asserted
 *                            (HALTED wins over every other transition)
 * - PAPER -> LIVE_LIMITED    promotion eligible AND liveTradingAuthorized
 * - HALTED -> PAPER          operator reset only (reset_halt), never from data
 *
 * Clearing liveTradingAuthorized does not revert LIVE_LIMITED; it only blocks
 * new promotions.
 */

#include "../types.hpp"
#include "trading_state.hpp"

#include <atomic>

namespace riskgov {
namespace trading {

/**
 * Per-cycle inputs to the transition function. Gathered by the Executor.
 */
struct ModeInputs {
    bool drawdown_breached = false;
    bool kill_switch = false;        // asserted and enabled
    bool promotion_eligible = false;
    bool live_authorized = false;
};

struct ModeTransition {
    Mode from = Mode::Paper;
    Mode to = Mode::Paper;
    HaltReason halt_reason = HaltReason::None;

    bool changed() const { return from != to; }
};

/**
 * Pure transition function. Exhaustive over Mode.
 */
inline ModeTransition next_mode(Mode current, const ModeInputs& in) {
    ModeTransition t{current, current, HaltReason::None};

    switch (current) {
    case Mode::Halted:
        // Terminal until operator reset
        return t;

    case Mode::Paper:
    case Mode::LiveLimited:
        if (in.kill_switch) {
            t.to = Mode::Halted;
            t.halt_reason = HaltReason::KillSwitch;
            return t;
        }
        if (in.drawdown_breached) {
            t.to = Mode::Halted;
            t.halt_reason = HaltReason::Drawdown;
            return t;
        }
        if (current == Mode::Paper && in.promotion_eligible && in.live_authorized) {
            t.to = Mode::LiveLimited;
        }
        return t;
    }
    return t;
}

/**
 * Enter HALTED. First halt wins: reason and time are kept if already halted.
 */
inline void trigger_halt(TradingState& state, HaltReason reason, Timestamp now_ns) {
    if (state.mode == Mode::Halted)
        return;
    state.mode = Mode::Halted;
    state.halt_reason = reason;
    state.halt_time_ns = now_ns;
}

/**
 * Operator action: HALTED -> PAPER.
 * @return false if the state was not halted (no-op)
 */
inline bool reset_halt(TradingState& state) {
    if (state.mode != Mode::Halted)
        return false;
    state.mode = Mode::Paper;
    state.halt_reason = HaltReason::None;
    state.halt_time_ns = 0;
    return true;
}

inline bool is_halted(const TradingState& state) {
    return state.mode == Mode::Halted;
}

inline const char* halt_reason_str(HaltReason reason) {
    switch (reason) {
    case HaltReason::None:
        return "none";
    case HaltReason::Drawdown:
        return "drawdown_exceeded";
    case HaltReason::KillSwitch:
        return "kill_switch";
    case HaltReason::Configured:
        return "configured";
    }
    return "unknown";
}

/**
 * Kill switch - polled once per cycle.
 *
 * assert_kill() is async-signal-safe (lock-free atomic store) so it can be
 * called from a signal handler or an operator thread.
 */
class KillSwitch {
public:
    void assert_kill() { asserted_.store(true, std::memory_order_release); }
    void clear() { asserted_.store(false, std::memory_order_release); }
    bool asserted() const { return asserted_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> asserted_{false};
};

} // namespace trading
} // namespace riskgov
