#pragma once

/**
 * Reporter - periodic read-only snapshot of TradingState
 *
 * snapshot() is a pure projection: two calls without an intervening cycle
 * return identical records. Reporting is observational only; a failing
 * sink is logged and swallowed so it can never delay a trading decision.
 *
 * Besides the state figures, each record summarizes the trade records
 * resolved in its period [period_start, timestamp]. A trade's P&L is its
 * realized P&L net of commission (0 for rejected and failed attempts).
 */

#include "../config/config.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "mode_machine.hpp"
#include "trading_state.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace riskgov {
namespace trading {

struct ReportRecord {
    Timestamp timestamp = 0;
    Mode mode = Mode::Paper;
    double capital = 0.0;
    double usable_capital = 0.0;
    double peak_capital = 0.0;
    double drawdown = 0.0;
    double daily_pnl = 0.0;
    size_t open_position_count = 0;
    size_t trade_count = 0;
    size_t win_count = 0;
    HaltReason halt_reason = HaltReason::None;

    // Period summary
    Timestamp period_start = 0;
    size_t period_trades = 0;
    size_t successful_trades = 0; // fills
    size_t failed_trades = 0;     // rejected or failed
    double success_rate = 0.0;
    double period_pnl = 0.0;
    double avg_trade_pnl = 0.0;
    double max_profit = 0.0;
    double max_loss = 0.0;
    // gross profit / gross loss; empty (JSON null) when there were profits
    // but no losses, 0 for a period without trades
    std::optional<double> profit_factor = 0.0;

    bool operator==(const ReportRecord&) const = default;
};

/**
 * Project state into a report record. Pure.
 * @param period_start_ns first resolve time included in the period summary
 */
ReportRecord snapshot(const TradingState& state, const RiskLimits& limits, Timestamp now_ns,
                      Timestamp period_start_ns = 0);

void to_json(nlohmann::json& j, const ReportRecord& record);

class Reporter {
public:
    using Sink = std::function<void(const std::string&)>;

    /**
     * @param interval_ns Time between reports
     * @param sink Receives one serialized JSON report per call
     */
    Reporter(Timestamp interval_ns, Sink sink, logging::AsyncLogger* logger = nullptr);

    /**
     * True if no report was emitted yet or the interval has elapsed.
     */
    bool due(Timestamp now_ns) const;

    /**
     * Snapshot, serialize and hand to the sink.
     * @return false if the sink threw; the failure is logged, never rethrown
     */
    bool emit(const TradingState& state, const RiskLimits& limits, Timestamp now_ns);

    /**
     * Sink that writes each report to directory/report_<UTC time>.json and
     * replaces directory/latest_report.json. Creates the directory.
     * Throws std::runtime_error when a file cannot be written.
     */
    static Sink file_sink(const std::string& directory);

    /**
     * Fan a report out to several sinks. Every sink is called; the first
     * failure is rethrown afterwards.
     */
    static Sink tee(std::vector<Sink> sinks);

    uint64_t emitted() const { return emitted_; }
    uint64_t failures() const { return failures_; }

private:
    Timestamp interval_ns_;
    Sink sink_;
    logging::AsyncLogger* logger_;
    Timestamp last_emit_ns_ = 0;
    bool has_emitted_ = false;
    uint64_t emitted_ = 0;
    uint64_t failures_ = 0;
};

} // namespace trading
} // namespace riskgov
