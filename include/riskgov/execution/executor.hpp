#pragma once

/**
 * Executor - one decision cycle, end to end
 *
 * execute_cycle(signal, now):
 * 1. Prune the rate window, recompute drawdown, evaluate mode transitions
 *    (kill switch and hard stop first; promotion only when authorized and
 *    a live client is wired)
 * 2. Validate the signal shape, then Governor::evaluate
 * 3. Select the client by mode: PAPER -> paper, LIVE_LIMITED -> live,
 *    HALTED -> none
 * 4. place_order, synchronously; no state is touched while it is in flight.
 *    An accepted order that comes back unfilled is cancelled and recorded
 *    as Failed (order_unfilled).
 * 5. On confirmed fill: capital, positions, dailyPnL, rate window,
 *    trade history, drawdown
 * 6. Feed the resolved outcome to the PromotionEngine
 *
 * Every order the exchange accepted enters the rate window, filled or not.
 *
 * The Executor is the only mutator of TradingState. Cycles are never
 * pipelined: one signal is fully resolved before the next is considered.
 */

#include "../config/config.hpp"
#include "../exchange/platform_client.hpp"
#include "../logging/async_logger.hpp"
#include "../trading/governor.hpp"
#include "../trading/mode_machine.hpp"
#include "../trading/promotion.hpp"
#include "../trading/trading_state.hpp"
#include "../types.hpp"

#include <optional>

namespace riskgov {
namespace execution {

/**
 * What a cycle changed in TradingState.
 */
struct StateDelta {
    double capital_before = 0.0;
    double capital_after = 0.0;
    double daily_pnl_delta = 0.0;
    double realized_pnl = 0.0;
    bool trade_recorded = false;
};

struct CycleResult {
    trading::ModeTransition transition;
    std::optional<trading::RiskDecision> decision; // empty when no signal
    std::optional<Order> order;                   // empty unless dispatched
    StateDelta delta;

    /// Reason the signal did not fill, None if it filled or there was none
    ReasonCode reason = ReasonCode::None;
};

class Executor {
public:
    /**
     * @param config Immutable config snapshot
     * @param state Trading state; this Executor becomes its only mutator
     * @param promotion Paper statistics fed with every resolved outcome
     * @param paper Paper client (required)
     * @param live Live client, or nullptr if live trading is not wired
     * @param kill_switch Polled once per cycle, may be nullptr
     * @param logger Optional logger, nullptr for silent operation
     * @param start_ns Start of the paper run
     */
    Executor(ConfigPtr config, trading::TradingState& state, trading::PromotionEngine& promotion,
             exchange::PlatformClient& paper, exchange::PlatformClient* live, const trading::KillSwitch* kill_switch,
             logging::AsyncLogger* logger, Timestamp start_ns);

    /**
     * Run one cycle. A cycle without a signal still evaluates transitions.
     */
    CycleResult execute_cycle(const std::optional<Signal>& signal, Timestamp now_ns);

    // =========================================================================
    // Operator actions
    // =========================================================================

    /**
     * HALTED -> PAPER. Restarts paper promotion tracking at now_ns.
     * @return false if not halted
     */
    bool reset_halt(Timestamp now_ns);

    /**
     * Daily boundary: zero daily P&L. External clock trigger.
     */
    void on_daily_boundary();

    /**
     * Swap in a new config snapshot for subsequent cycles.
     * Throws ConfigError if the snapshot is null or fails validation.
     */
    void replace_config(ConfigPtr config);

    // =========================================================================
    // Accessors
    // =========================================================================

    const trading::TradingState& state() const { return state_; }
    const Config& config() const { return *config_; }
    uint64_t cycle_count() const { return cycle_count_; }

    /**
     * Shape check for external signals.
     * @return false for empty symbol, non-positive or non-finite price or
     *         size, confidence outside [0, 1]
     */
    static bool validate_signal(const Signal& signal);

private:
    trading::ModeTransition evaluate_mode(Timestamp now_ns);
    void apply_transition(const trading::ModeTransition& t, Timestamp now_ns);
    exchange::PlatformClient* select_client(Mode mode) const;
    void dispatch(const Signal& signal, Timestamp now_ns, CycleResult& result);
    void record_attempt(const Order& order, trading::TradeOutcome outcome, double commission, double realized_pnl,
                        Timestamp now_ns);

    ConfigPtr config_;
    trading::TradingState& state_;
    trading::PromotionEngine& promotion_;
    exchange::PlatformClient& paper_;
    exchange::PlatformClient* live_;
    const trading::KillSwitch* kill_switch_;
    logging::AsyncLogger* logger_;
    uint64_t cycle_count_;
};

} // namespace execution
} // namespace riskgov
