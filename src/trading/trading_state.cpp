#include "../../include/riskgov/trading/trading_state.hpp"

#include <algorithm>
#include <cmath>

namespace riskgov::trading {

namespace {

// Quantities below this are treated as flat
constexpr double QTY_EPSILON = 1e-12;

} // namespace

FillEffect apply_fill(TradingState& state, const Symbol& symbol, Side side, double quantity, double price,
                      double commission, Timestamp fill_time_ns) {
    FillEffect effect;
    Position& pos = state.open_positions[symbol];

    // === Mark existing exposure to the fill price ===
    if (pos.quantity != 0.0 && pos.mark_price > 0.0) {
        effect.capital_delta += pos.quantity * (price - pos.mark_price);
    }
    effect.capital_delta -= commission;

    // === Adjust position ===
    double signed_qty = side == Side::Buy ? quantity : -quantity;
    double old_qty = pos.quantity;
    double new_qty = old_qty + signed_qty;

    bool same_direction = old_qty == 0.0 || (old_qty > 0.0) == (signed_qty > 0.0);
    if (same_direction) {
        // Opening or adding: weighted average entry
        double total_cost = pos.avg_entry * std::abs(old_qty) + price * quantity;
        pos.avg_entry = total_cost / std::abs(new_qty);
        if (old_qty == 0.0) {
            pos.open_time_ns = fill_time_ns;
        }
    } else {
        // Reducing, closing or flipping
        double reduced = std::min(std::abs(old_qty), quantity);
        double direction = old_qty > 0.0 ? 1.0 : -1.0;
        effect.realized_pnl = (price - pos.avg_entry) * reduced * direction;
        effect.closed_quantity = reduced;

        if (std::abs(new_qty) > QTY_EPSILON && (new_qty > 0.0) != (old_qty > 0.0)) {
            // Flipped through flat: remainder opens at the fill price
            pos.avg_entry = price;
            pos.open_time_ns = fill_time_ns;
        }
    }

    pos.quantity = new_qty;
    pos.mark_price = price;

    if (std::abs(pos.quantity) <= QTY_EPSILON) {
        state.open_positions.erase(symbol);
    }

    // === Account ===
    state.capital += effect.capital_delta;
    state.daily_pnl += effect.capital_delta;
    state.trade_timestamps.push_back(fill_time_ns);
    recompute_drawdown(state);

    return effect;
}

} // namespace riskgov::trading
