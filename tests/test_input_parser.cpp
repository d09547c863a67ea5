#include "../include/riskgov/errors.hpp"
#include "../include/riskgov/util/input_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace riskgov;
using namespace riskgov::util;

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

static bool parse_fails(const std::string& line) {
    try {
        parse_input_line(line);
    } catch (const ParseError&) {
        return true;
    }
    return false;
}

TEST(parses_signal) {
    InputLine in =
        parse_input_line(R"({"symbol":"BTC/CAD","action":"buy","price":50000,"confidence":0.7,"size":200})");
    ASSERT_TRUE(in.signal.has_value());
    ASSERT_EQ(in.command, Command::None);
    ASSERT_EQ(in.signal->symbol, std::string("BTC/CAD"));
    ASSERT_EQ(in.signal->action, Side::Buy);
    ASSERT_EQ(in.signal->price, 50000.0);
    ASSERT_EQ(in.signal->confidence, 0.7);
    ASSERT_EQ(in.signal->requested_size, 200.0);
}

TEST(confidence_defaults_to_one) {
    InputLine in = parse_input_line(R"({"symbol":"ETH/CAD","action":"SELL","price":3000,"size":50})");
    ASSERT_EQ(in.signal->action, Side::Sell);
    ASSERT_EQ(in.signal->confidence, 1.0);
}

TEST(out_of_range_values_pass_through) {
    // Range checks belong to the Executor (invalid_signal)
    InputLine in = parse_input_line(R"({"symbol":"ETH/CAD","action":"buy","price":-1,"size":0,"confidence":3})");
    ASSERT_TRUE(in.signal.has_value());
    ASSERT_EQ(in.signal->price, -1.0);
}

TEST(parses_commands) {
    ASSERT_EQ(parse_input_line(R"({"command":"reset_halt"})").command, Command::ResetHalt);
    ASSERT_EQ(parse_input_line(R"({"command":"daily_reset"})").command, Command::DailyReset);
    ASSERT_EQ(parse_input_line(R"({"command":"kill"})").command, Command::Kill);
    ASSERT_EQ(parse_input_line(R"({"command":"clear_kill"})").command, Command::ClearKill);
    ASSERT_FALSE(parse_input_line(R"({"command":"kill"})").signal.has_value());
}

TEST(blank_line_is_empty_cycle) {
    InputLine in = parse_input_line("   ");
    ASSERT_FALSE(in.signal.has_value());
    ASSERT_EQ(in.command, Command::None);
}

TEST(malformed_lines_throw) {
    ASSERT_TRUE(parse_fails("{not json"));
    ASSERT_TRUE(parse_fails("[1,2,3]"));
    ASSERT_TRUE(parse_fails(R"({"command":"launch"})"));
    ASSERT_TRUE(parse_fails(R"({"command":7})"));
    ASSERT_TRUE(parse_fails(R"({"action":"buy","price":1,"size":1})"));
    ASSERT_TRUE(parse_fails(R"({"symbol":"BTC/CAD","action":"hold","price":1,"size":1})"));
    ASSERT_TRUE(parse_fails(R"({"symbol":"BTC/CAD","action":"buy","price":"1","size":1})"));
    ASSERT_TRUE(parse_fails(R"({"symbol":"BTC/CAD","action":"buy","price":1})"));
}

int main() {
    std::cout << "\n=== Input Parser Tests ===\n\n";

    RUN_TEST(parses_signal);
    RUN_TEST(confidence_defaults_to_one);
    RUN_TEST(out_of_range_values_pass_through);
    RUN_TEST(parses_commands);
    RUN_TEST(blank_line_is_empty_cycle);
    RUN_TEST(malformed_lines_throw);

    std::cout << "\n=== All Input Parser Tests Passed! ===\n";
    return 0;
}
