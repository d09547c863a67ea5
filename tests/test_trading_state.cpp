/**
 * TradingState Test Suite
 *
 * Fill accounting:
 * - commission and mark-to-market flow into capital and daily P&L
 * - weighted average entry, realized P&L on reductions, flips
 * - rate-limit window bookkeeping
 * - drawdown from peak
 */

#include "../include/riskgov/trading/trading_state.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace riskgov;
using namespace riskgov::trading;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

constexpr Timestamp T0 = 1'700'000'000ULL * NS_PER_SECOND;

// =============================================================================
// init
// =============================================================================

TEST(init_sets_capital_and_peak) {
    TradingState state;
    state.init(10000.0);

    ASSERT_EQ(state.mode, Mode::Paper);
    ASSERT_EQ(state.capital, 10000.0);
    ASSERT_EQ(state.peak_capital, 10000.0);
    ASSERT_EQ(state.daily_pnl, 0.0);
    ASSERT_EQ(state.drawdown, 0.0);
    ASSERT_EQ(state.open_position_count(), 0u);
    ASSERT_TRUE(state.trade_history.empty());
}

// =============================================================================
// apply_fill
// =============================================================================

TEST(opening_fill_charges_commission_only) {
    TradingState state;
    state.init(10000.0);

    FillEffect e = apply_fill(state, "BTC/CAD", Side::Buy, 0.004, 50000.0, 0.2, T0);

    ASSERT_NEAR(e.capital_delta, -0.2, 1e-9);
    ASSERT_EQ(e.realized_pnl, 0.0);
    ASSERT_EQ(e.closed_quantity, 0.0);
    ASSERT_NEAR(state.capital, 9999.8, 1e-9);
    ASSERT_NEAR(state.daily_pnl, -0.2, 1e-9);
    ASSERT_EQ(state.open_position_count(), 1u);
    ASSERT_NEAR(state.open_positions["BTC/CAD"].quantity, 0.004, 1e-12);
    ASSERT_NEAR(state.open_positions["BTC/CAD"].avg_entry, 50000.0, 1e-9);
    ASSERT_EQ(state.trade_timestamps.size(), 1u);
}

TEST(closing_fill_realizes_and_erases) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "BTC/CAD", Side::Buy, 0.004, 50000.0, 0.2, T0);

    FillEffect e = apply_fill(state, "BTC/CAD", Side::Sell, 0.004, 55000.0, 0.22, T0 + NS_PER_MINUTE);

    ASSERT_NEAR(e.realized_pnl, 20.0, 1e-9);
    ASSERT_NEAR(e.closed_quantity, 0.004, 1e-12);
    ASSERT_NEAR(e.capital_delta, 20.0 - 0.22, 1e-9);
    ASSERT_NEAR(state.capital, 10019.58, 1e-9);
    ASSERT_EQ(state.open_position_count(), 0u);
    ASSERT_NEAR(state.peak_capital, 10019.58, 1e-9);
    ASSERT_EQ(state.drawdown, 0.0);
}

TEST(adding_fill_averages_entry) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "ETH/CAD", Side::Buy, 1.0, 100.0, 0.0, T0);
    FillEffect e = apply_fill(state, "ETH/CAD", Side::Buy, 1.0, 110.0, 0.0, T0 + 1);
    ASSERT_EQ(e.closed_quantity, 0.0);

    const Position& pos = state.open_positions["ETH/CAD"];
    ASSERT_NEAR(pos.quantity, 2.0, 1e-12);
    ASSERT_NEAR(pos.avg_entry, 105.0, 1e-9);
    ASSERT_EQ(pos.open_time_ns, T0);
    // First lot marked from 100 to 110
    ASSERT_NEAR(state.capital, 10010.0, 1e-9);
}

TEST(losing_close_reports_negative_pnl) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "ETH/CAD", Side::Buy, 2.0, 100.0, 0.0, T0);

    FillEffect e = apply_fill(state, "ETH/CAD", Side::Sell, 1.0, 90.0, 0.0, T0 + 1);

    ASSERT_NEAR(e.realized_pnl, -10.0, 1e-9);
    ASSERT_NEAR(state.capital, 9980.0, 1e-9); // both units marked down 10
    ASSERT_NEAR(state.open_positions["ETH/CAD"].quantity, 1.0, 1e-12);
    ASSERT_NEAR(state.drawdown, 0.002, 1e-12);
}

TEST(flip_reopens_at_fill_price) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "ETH/CAD", Side::Buy, 1.0, 100.0, 0.0, T0);

    FillEffect e = apply_fill(state, "ETH/CAD", Side::Sell, 3.0, 110.0, 0.0, T0 + 5);

    ASSERT_NEAR(e.realized_pnl, 10.0, 1e-9);
    ASSERT_NEAR(e.closed_quantity, 1.0, 1e-12); // only the long lot closed
    const Position& pos = state.open_positions["ETH/CAD"];
    ASSERT_NEAR(pos.quantity, -2.0, 1e-12);
    ASSERT_NEAR(pos.avg_entry, 110.0, 1e-9);
    ASSERT_EQ(pos.open_time_ns, T0 + 5);
}

TEST(short_position_marks_inverse) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "ETH/CAD", Side::Sell, 1.0, 100.0, 0.0, T0);
    FillEffect e = apply_fill(state, "ETH/CAD", Side::Buy, 1.0, 80.0, 0.0, T0 + 1);

    ASSERT_NEAR(e.realized_pnl, 20.0, 1e-9);
    ASSERT_NEAR(state.capital, 10020.0, 1e-9);
    ASSERT_EQ(state.open_position_count(), 0u);
}

// =============================================================================
// Drawdown and window
// =============================================================================

TEST(calculate_drawdown_bounds) {
    ASSERT_EQ(calculate_drawdown(10000.0, 10000.0), 0.0);
    ASSERT_EQ(calculate_drawdown(11000.0, 10000.0), 0.0);
    ASSERT_NEAR(calculate_drawdown(7000.0, 10000.0), 0.3, 1e-12);
    ASSERT_EQ(calculate_drawdown(-5.0, 10000.0), 1.0);
    ASSERT_EQ(calculate_drawdown(100.0, 0.0), 0.0);
}

TEST(recompute_raises_peak) {
    TradingState state;
    state.init(10000.0);
    state.capital = 12000.0;
    recompute_drawdown(state);
    ASSERT_EQ(state.peak_capital, 12000.0);

    state.capital = 9000.0;
    recompute_drawdown(state);
    ASSERT_EQ(state.peak_capital, 12000.0);
    ASSERT_NEAR(state.drawdown, 0.25, 1e-12);
}

TEST(prune_and_count_window) {
    TradingState state;
    state.init(10000.0);
    state.trade_timestamps = {T0, T0 + 30 * NS_PER_MINUTE, T0 + 50 * NS_PER_MINUTE};

    Timestamp now = T0 + 70 * NS_PER_MINUTE;
    ASSERT_EQ(trades_in_window(state, now), 2u);

    prune_trade_window(state, now);
    ASSERT_EQ(state.trade_timestamps.size(), 2u);
    ASSERT_EQ(state.trade_timestamps.front(), T0 + 30 * NS_PER_MINUTE);

    // Accepted orders that did not fill count the same as fills
    record_order_activity(state, now);
    ASSERT_EQ(trades_in_window(state, now + 1), 3u);
}

TEST(daily_reset_keeps_drawdown) {
    TradingState state;
    state.init(10000.0);
    apply_fill(state, "ETH/CAD", Side::Buy, 10.0, 100.0, 0.0, T0);
    apply_fill(state, "ETH/CAD", Side::Sell, 10.0, 50.0, 0.0, T0 + 1);

    ASSERT_NEAR(state.daily_pnl, -500.0, 1e-9);
    double dd = state.drawdown;

    reset_daily_risk(state);
    ASSERT_EQ(state.daily_pnl, 0.0);
    ASSERT_EQ(state.drawdown, dd);
    ASSERT_NEAR(state.capital, 9500.0, 1e-9);
}

int main() {
    std::cout << "\n=== TradingState Tests ===\n\n";

    std::cout << "init Tests:\n";
    RUN_TEST(init_sets_capital_and_peak);

    std::cout << "\napply_fill Tests:\n";
    RUN_TEST(opening_fill_charges_commission_only);
    RUN_TEST(closing_fill_realizes_and_erases);
    RUN_TEST(adding_fill_averages_entry);
    RUN_TEST(losing_close_reports_negative_pnl);
    RUN_TEST(flip_reopens_at_fill_price);
    RUN_TEST(short_position_marks_inverse);

    std::cout << "\nDrawdown / Window Tests:\n";
    RUN_TEST(calculate_drawdown_bounds);
    RUN_TEST(recompute_raises_peak);
    RUN_TEST(prune_and_count_window);
    RUN_TEST(daily_reset_keeps_drawdown);

    std::cout << "\n=== All TradingState Tests Passed! ===\n";
    return 0;
}
