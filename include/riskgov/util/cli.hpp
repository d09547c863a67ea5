#pragma once

/**
 * CLI utilities for the governor trader
 *
 * Command-line flags are the last configuration layer: they override the
 * JSON file and the environment.
 */

#include "../config/config.hpp"
#include "../errors.hpp"
#include "../types.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace riskgov {
namespace util {

/**
 * Command-line arguments for the trader application.
 * Unset optionals leave the lower configuration layers in effect.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string config_path;
    std::optional<Mode> mode;
    std::optional<bool> authorize_live;
    std::optional<double> capital;
    std::optional<uint32_t> report_interval_sec;
    std::optional<std::string> report_dir;
};

/**
 * Print help message for the trader application.
 */
inline void print_help() {
    std::cout << R"(
Risk Governor
=============

Usage: riskgov_trader [options] < signals.ndjson

Reads one JSON object per line from stdin:
  {"symbol":"BTC/CAD","action":"buy","price":50000,"confidence":0.7,"size":200}
  {"command":"reset_halt" | "daily_reset" | "kill" | "clear_kill"}

Options:
  --config FILE          JSON config file (applied before environment)
  --paper, -p            Start in PAPER mode (default)
  --halted               Start HALTED (operator reset required)
  --authorize-live       Allow promotion to LIVE_LIMITED when eligible
  --no-live              Forbid promotion to LIVE_LIMITED
  -c, --capital AMOUNT   Initial capital (default: 10000)
  --report-interval SECS Seconds between reports (default: 3600)
  --report-dir DIR       Also write each report to DIR/report_<time>.json
                         and DIR/latest_report.json
  -v, --verbose          Debug logging
  -h, --help             Show this help

Signals:
  SIGINT, SIGTERM        Graceful shutdown
  SIGUSR1                Assert the kill switch

Live trading requires NDAX_API_KEY, NDAX_API_SECRET, NDAX_USER_ID and
NDAX_ACCOUNT_ID in the environment.
)";
}

/**
 * Parse a non-negative 32-bit count. Throws std::out_of_range or
 * std::invalid_argument (both std::logic_error) on bad input.
 */
inline uint32_t parse_count(const std::string& s) {
    size_t used = 0;
    long long value = std::stoll(s, &used);
    if (used != s.size()) {
        throw std::invalid_argument(s);
    }
    if (value < 0 || value > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
        throw std::out_of_range(s);
    }
    return static_cast<uint32_t>(value);
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
            }
            else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            }
            else if (arg == "--paper" || arg == "-p") {
                args.mode = Mode::Paper;
            }
            else if (arg == "--halted") {
                args.mode = Mode::Halted;
            }
            else if (arg == "--authorize-live") {
                args.authorize_live = true;
            }
            else if (arg == "--no-live") {
                args.authorize_live = false;
            }
            else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            }
            else if ((arg == "--capital" || arg == "-c") && i + 1 < argc) {
                args.capital = std::stod(argv[++i]);
            }
            else if (arg == "--report-interval" && i + 1 < argc) {
                args.report_interval_sec = parse_count(argv[++i]);
            }
            else if (arg == "--report-dir" && i + 1 < argc) {
                args.report_dir = argv[++i];
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Invalid numeric argument\n";
        return false;
    }
    return true;
}

/**
 * Overlay CLI flags onto a config. Throws ConfigError if the result is invalid.
 */
inline void apply_cli(const CLIArgs& args, Config& cfg) {
    if (args.mode)
        cfg.mode = *args.mode;
    if (args.authorize_live)
        cfg.live_trading_authorized = *args.authorize_live;
    if (args.capital)
        cfg.initial_capital = *args.capital;
    if (args.report_interval_sec)
        cfg.execution.report_interval_sec = *args.report_interval_sec;
    if (args.report_dir)
        cfg.execution.report_dir = *args.report_dir;
    cfg.validate();
}

}  // namespace util
}  // namespace riskgov
