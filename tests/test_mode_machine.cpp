#include "../include/riskgov/trading/mode_machine.hpp"

#include <cassert>
#include <iostream>
#include <string>

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

// =============================================================================
// next_mode Tests
// =============================================================================

TEST(paper_stays_paper_without_inputs) {
    ModeTransition t = next_mode(Mode::Paper, ModeInputs{});
    ASSERT_FALSE(t.changed());
    ASSERT_EQ(t.to, Mode::Paper);
}

TEST(promotion_requires_authorization) {
    ModeInputs in;
    in.promotion_eligible = true;
    in.live_authorized = false;
    ASSERT_EQ(next_mode(Mode::Paper, in).to, Mode::Paper);

    in.live_authorized = true;
    ModeTransition t = next_mode(Mode::Paper, in);
    ASSERT_TRUE(t.changed());
    ASSERT_EQ(t.to, Mode::LiveLimited);
}

TEST(authorization_alone_does_not_promote) {
    ModeInputs in;
    in.live_authorized = true;
    ASSERT_EQ(next_mode(Mode::Paper, in).to, Mode::Paper);
}

TEST(revoking_authorization_keeps_live) {
    ModeInputs in;
    in.promotion_eligible = true;
    in.live_authorized = false;
    ASSERT_EQ(next_mode(Mode::LiveLimited, in).to, Mode::LiveLimited);
}

TEST(drawdown_halts_any_active_mode) {
    ModeInputs in;
    in.drawdown_breached = true;
    in.promotion_eligible = true;
    in.live_authorized = true;

    for (Mode m : {Mode::Paper, Mode::LiveLimited}) {
        ModeTransition t = next_mode(m, in);
        ASSERT_EQ(t.to, Mode::Halted);
        ASSERT_EQ(t.halt_reason, HaltReason::Drawdown);
    }
}

TEST(kill_switch_wins_over_drawdown) {
    ModeInputs in;
    in.drawdown_breached = true;
    in.kill_switch = true;

    ModeTransition t = next_mode(Mode::LiveLimited, in);
    ASSERT_EQ(t.to, Mode::Halted);
    ASSERT_EQ(t.halt_reason, HaltReason::KillSwitch);
}

TEST(halted_is_terminal) {
    ModeInputs in;
    in.promotion_eligible = true;
    in.live_authorized = true;
    ModeTransition t = next_mode(Mode::Halted, in);
    ASSERT_FALSE(t.changed());
    ASSERT_EQ(t.to, Mode::Halted);
}

// =============================================================================
// trigger_halt / reset_halt Tests
// =============================================================================

TEST(trigger_halt_first_reason_wins) {
    TradingState state;
    state.init(10000.0);

    trigger_halt(state, HaltReason::Drawdown, 100);
    trigger_halt(state, HaltReason::KillSwitch, 200);

    ASSERT_TRUE(is_halted(state));
    ASSERT_EQ(state.halt_reason, HaltReason::Drawdown);
    ASSERT_EQ(state.halt_time_ns, 100u);
}

TEST(reset_halt_returns_to_paper) {
    TradingState state;
    state.init(10000.0);
    trigger_halt(state, HaltReason::KillSwitch, 100);

    ASSERT_TRUE(reset_halt(state));
    ASSERT_EQ(state.mode, Mode::Paper);
    ASSERT_EQ(state.halt_reason, HaltReason::None);
    ASSERT_EQ(state.halt_time_ns, 0u);
}

TEST(reset_halt_noop_when_running) {
    TradingState state;
    state.init(10000.0);
    state.mode = Mode::LiveLimited;
    ASSERT_FALSE(reset_halt(state));
    ASSERT_EQ(state.mode, Mode::LiveLimited);
}

TEST(configured_halt_start) {
    TradingState state;
    state.init(10000.0, Mode::Halted);
    ASSERT_TRUE(is_halted(state));
    ASSERT_EQ(std::string(halt_reason_str(state.halt_reason)), "configured");
}

// =============================================================================
// KillSwitch Tests
// =============================================================================

TEST(kill_switch_assert_and_clear) {
    KillSwitch ks;
    ASSERT_FALSE(ks.asserted());
    ks.assert_kill();
    ASSERT_TRUE(ks.asserted());
    ks.clear();
    ASSERT_FALSE(ks.asserted());
}

TEST(mode_strings) {
    ASSERT_EQ(std::string(mode_to_string(Mode::Paper)), "PAPER");
    ASSERT_EQ(std::string(mode_to_string(Mode::LiveLimited)), "LIVE_LIMITED");
    ASSERT_EQ(std::string(mode_to_string(Mode::Halted)), "HALTED");
}

int main() {
    std::cout << "\n=== Mode State Machine Tests ===\n\n";

    std::cout << "next_mode Tests:\n";
    RUN_TEST(paper_stays_paper_without_inputs);
    RUN_TEST(promotion_requires_authorization);
    RUN_TEST(authorization_alone_does_not_promote);
    RUN_TEST(revoking_authorization_keeps_live);
    RUN_TEST(drawdown_halts_any_active_mode);
    RUN_TEST(kill_switch_wins_over_drawdown);
    RUN_TEST(halted_is_terminal);

    std::cout << "\nHalt Tests:\n";
    RUN_TEST(trigger_halt_first_reason_wins);
    RUN_TEST(reset_halt_returns_to_paper);
    RUN_TEST(reset_halt_noop_when_running);
    RUN_TEST(configured_halt_start);

    std::cout << "\nKillSwitch Tests:\n";
    RUN_TEST(kill_switch_assert_and_clear);
    RUN_TEST(mode_strings);

    std::cout << "\n=== All Mode State Machine Tests Passed! ===\n";
    return 0;
}
