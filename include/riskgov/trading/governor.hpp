#pragma once

/**
 * Governor - Pre-trade Risk Evaluation
 *
 * Pure evaluator: reads a const TradingState, a Signal and RiskLimits plus an
 * injected current time. No I/O, no clock reads, no state mutation.
 *
 * Checks, in fixed order (first failure wins):
 * 1. Halt          - mode is HALTED                          -> mode_halted
 * 2. Hard stop     - drawdown >= hardStopLossDrawdown        -> drawdown_exceeded (+ halt request)
 * 3. Daily loss    - dailyPnL <= -maxDailyLossFraction*cap   -> daily_loss_limit
 * 4. Rate limit    - fills in trailing hour >= maxTradesPerHour -> rate_limited
 * 5. Sizing        - requestedSize > maxPosition*usable      -> position_too_large
 *
 * Sizing never clamps: a signal is accepted at its requested size or rejected.
 */

#include "../config/config.hpp"
#include "../types.hpp"
#include "trading_state.hpp"

namespace riskgov {
namespace trading {

struct RiskDecision {
    bool approved = false;
    ReasonCode reason = ReasonCode::None;
    bool halt_requested = false; // only set with DrawdownExceeded

    static RiskDecision approve() { return RiskDecision{true, ReasonCode::None, false}; }
    static RiskDecision reject(ReasonCode reason) { return RiskDecision{false, reason, false}; }
};

/**
 * Hard stop-loss predicate, shared by the Governor and the mode transition
 * step so both agree on the boundary.
 */
inline bool drawdown_breached(const TradingState& state, const RiskLimits& limits) {
    return state.drawdown >= limits.hard_stop_loss_drawdown;
}

inline bool daily_loss_breached(const TradingState& state, const RiskLimits& limits) {
    return state.daily_pnl <= -limits.max_daily_loss_fraction * state.capital;
}

class Governor {
public:
    /**
     * Evaluate one signal.
     *
     * @param signal Candidate signal (already validated for shape)
     * @param state Read-only view of trading state
     * @param limits Risk limits from the current Config snapshot
     * @param now_ns Injected current time (rate-limit window end)
     */
    static RiskDecision evaluate(const Signal& signal, const TradingState& state, const RiskLimits& limits,
                                 Timestamp now_ns) {
        // 1. Halt
        if (state.mode == Mode::Halted) {
            return RiskDecision::reject(ReasonCode::ModeHalted);
        }

        // 2. Hard stop-loss - the only check that escalates
        if (drawdown_breached(state, limits)) {
            RiskDecision d = RiskDecision::reject(ReasonCode::DrawdownExceeded);
            d.halt_requested = true;
            return d;
        }

        // 3. Daily loss
        if (daily_loss_breached(state, limits)) {
            return RiskDecision::reject(ReasonCode::DailyLossLimit);
        }

        // 4. Rate limit over the trailing 60 minutes
        if (trades_in_window(state, now_ns) >= limits.max_trades_per_hour) {
            return RiskDecision::reject(ReasonCode::RateLimited);
        }

        // 5. Position sizing
        if (signal.requested_size > max_position_size(state.capital, limits)) {
            return RiskDecision::reject(ReasonCode::PositionTooLarge);
        }

        return RiskDecision::approve();
    }
};

} // namespace trading
} // namespace riskgov
