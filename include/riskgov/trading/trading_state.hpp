#pragma once

/**
 * TradingState - the single mutable object of the governor core.
 *
 * Ownership:
 * - Created once at process start from Config (zero positions, initial capital)
 * - Mutated only by Executor, after Governor and PlatformClient have returned
 * - Read by Governor, PromotionEngine and Reporter through const references
 *
 * Accounting (see apply_fill):
 * - capital is account value with open positions marked at their last fill
 * - daily_pnl accumulates mark-to-market deltas and commissions since the
 *   last daily boundary
 * - drawdown is (peak_capital - capital) / peak_capital, recomputed each cycle
 */

#include "../types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace riskgov {
namespace trading {

/**
 * Open position for one symbol. Signed quantity: negative = short.
 */
struct Position {
    double quantity = 0.0;
    double avg_entry = 0.0;
    double mark_price = 0.0; // last fill price
    Timestamp open_time_ns = 0;
};

/**
 * How a dispatched order ended, as seen by promotion statistics.
 *
 * Win and Loss are fills that closed exposure, judged on realized P&L net of
 * commission. Opened is a fill that only opened or added to a position; it
 * has no result yet and is not scored.
 */
enum class TradeOutcome : uint8_t { Win = 0, Loss = 1, Rejected = 2, Failed = 3, Opened = 4 };

inline const char* trade_outcome_to_string(TradeOutcome outcome) {
    switch (outcome) {
    case TradeOutcome::Win:
        return "win";
    case TradeOutcome::Loss:
        return "loss";
    case TradeOutcome::Rejected:
        return "rejected";
    case TradeOutcome::Failed:
        return "failed";
    case TradeOutcome::Opened:
        return "opened";
    }
    return "unknown";
}

/**
 * One resolved execution attempt. Failed and exchange-rejected attempts are
 * recorded too so promotion statistics see execution failures.
 */
struct TradeRecord {
    OrderId order_id = INVALID_ORDER_ID;
    Symbol symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    double notional = 0.0;
    double commission = 0.0;
    double realized_pnl = 0.0; // gross, on the reduced part of the position
    TradeOutcome outcome = TradeOutcome::Win;
    ReasonCode reason = ReasonCode::None;
    Mode mode = Mode::Paper;
    Timestamp submit_time_ns = 0;
    Timestamp resolve_time_ns = 0;
};

/**
 * Why the state machine entered HALTED.
 */
enum class HaltReason : uint8_t { None = 0, Drawdown = 1, KillSwitch = 2, Configured = 3 };

struct TradingState {
    Mode mode = Mode::Paper;
    HaltReason halt_reason = HaltReason::None;
    Timestamp halt_time_ns = 0;

    double capital = 0.0;
    double peak_capital = 0.0;
    double daily_pnl = 0.0;
    double drawdown = 0.0;

    std::map<Symbol, Position> open_positions;
    std::deque<Timestamp> trade_timestamps; // exchange-accepted order times, oldest first
    std::vector<TradeRecord> trade_history; // append-only

    void init(double initial_capital, Mode initial_mode = Mode::Paper) {
        mode = initial_mode;
        halt_reason = initial_mode == Mode::Halted ? HaltReason::Configured : HaltReason::None;
        halt_time_ns = 0;
        capital = initial_capital;
        peak_capital = initial_capital;
        daily_pnl = 0.0;
        drawdown = 0.0;
        open_positions.clear();
        trade_timestamps.clear();
        trade_history.clear();
    }

    size_t open_position_count() const { return open_positions.size(); }
};

// =============================================================================
// State helpers (used by Executor; pure where marked)
// =============================================================================

/**
 * Drawdown from peak. Pure.
 * @return fraction in [0, 1]; 0 at or above peak
 */
inline double calculate_drawdown(double capital, double peak_capital) {
    if (peak_capital <= 0.0 || capital >= peak_capital)
        return 0.0;
    double dd = (peak_capital - capital) / peak_capital;
    return dd > 1.0 ? 1.0 : dd;
}

/**
 * Update peak and recompute drawdown from current capital.
 */
inline void recompute_drawdown(TradingState& state) {
    if (state.capital > state.peak_capital) {
        state.peak_capital = state.capital;
    }
    state.drawdown = calculate_drawdown(state.capital, state.peak_capital);
}

/**
 * Count orders within the trailing window ending at now_ns. Pure.
 */
inline size_t trades_in_window(const TradingState& state, Timestamp now_ns, Timestamp window_ns = NS_PER_HOUR) {
    size_t count = 0;
    for (auto it = state.trade_timestamps.rbegin(); it != state.trade_timestamps.rend(); ++it) {
        if (*it + window_ns <= now_ns)
            break; // older entries are older still
        ++count;
    }
    return count;
}

/**
 * Drop timestamps that left the trailing window.
 */
inline void prune_trade_window(TradingState& state, Timestamp now_ns, Timestamp window_ns = NS_PER_HOUR) {
    while (!state.trade_timestamps.empty() && state.trade_timestamps.front() + window_ns <= now_ns) {
        state.trade_timestamps.pop_front();
    }
}

/**
 * Count an exchange-accepted order that did not fill against the rate
 * window. Fills are counted by apply_fill.
 */
inline void record_order_activity(TradingState& state, Timestamp now_ns) {
    state.trade_timestamps.push_back(now_ns);
}

/**
 * Result of applying a confirmed fill to the state.
 */
struct FillEffect {
    double capital_delta = 0.0; // mark-to-market delta minus commission
    double realized_pnl = 0.0;  // gross realized on the reduced quantity
    double closed_quantity = 0.0; // 0 when the fill only opened or added
};

/**
 * Apply a confirmed fill.
 *
 * 1. Mark the existing position to the fill price (capital, daily_pnl)
 * 2. Charge commission (capital, daily_pnl)
 * 3. Adjust position size, average entry and realized P&L
 * 4. Append fill time to the rate-limit window, recompute drawdown
 *
 * Trade history is appended by the caller, which owns the full order context.
 */
FillEffect apply_fill(TradingState& state, const Symbol& symbol, Side side, double quantity, double price,
                      double commission, Timestamp fill_time_ns);

/**
 * Zero daily P&L at the daily boundary. Drawdown persists across days.
 */
inline void reset_daily_risk(TradingState& state) {
    state.daily_pnl = 0.0;
}

} // namespace trading
} // namespace riskgov
