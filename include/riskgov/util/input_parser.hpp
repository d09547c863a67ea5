#pragma once

/**
 * Input line parser for the trader's NDJSON stdin feed.
 *
 * Signal:   {"symbol":"BTC/CAD","action":"buy","price":50000,
 *            "confidence":0.7,"size":200}
 * Command:  {"command":"reset_halt"}   (reset_halt, daily_reset, kill, clear_kill)
 * Blank:    a cycle without a signal
 *
 * Shape errors (missing fields, wrong types, unknown action or command)
 * throw ParseError. Range checks are left to the Executor so an
 * out-of-range signal still produces an invalid_signal rejection.
 */

#include "../types.hpp"

#include <optional>
#include <string>

namespace riskgov {
namespace util {

enum class Command : uint8_t { None = 0, ResetHalt, DailyReset, Kill, ClearKill };

inline const char* command_to_string(Command cmd) {
    switch (cmd) {
    case Command::None:
        return "none";
    case Command::ResetHalt:
        return "reset_halt";
    case Command::DailyReset:
        return "daily_reset";
    case Command::Kill:
        return "kill";
    case Command::ClearKill:
        return "clear_kill";
    }
    return "unknown";
}

struct InputLine {
    std::optional<Signal> signal;
    Command command = Command::None;
};

InputLine parse_input_line(const std::string& line);

} // namespace util
} // namespace riskgov
