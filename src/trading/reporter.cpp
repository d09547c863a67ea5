#include "../../include/riskgov/trading/reporter.hpp"

#include "../../include/riskgov/util/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace riskgov::trading {

namespace {

// Net P&L of one attempt; rejected and failed attempts moved no money
double net_pnl(const TradeRecord& t) {
    if (t.outcome == TradeOutcome::Rejected || t.outcome == TradeOutcome::Failed)
        return 0.0;
    return t.realized_pnl - t.commission;
}

void summarize_period(const TradingState& state, Timestamp start_ns, Timestamp end_ns, ReportRecord& r) {
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    bool first = true;

    for (const auto& t : state.trade_history) {
        if (t.resolve_time_ns < start_ns || t.resolve_time_ns > end_ns)
            continue;
        r.period_trades++;
        if (t.outcome == TradeOutcome::Rejected || t.outcome == TradeOutcome::Failed) {
            r.failed_trades++;
        } else {
            r.successful_trades++;
        }

        double pnl = net_pnl(t);
        r.period_pnl += pnl;
        if (pnl > 0.0)
            gross_profit += pnl;
        else if (pnl < 0.0)
            gross_loss -= pnl;
        if (first || pnl > r.max_profit)
            r.max_profit = pnl;
        if (first || pnl < r.max_loss)
            r.max_loss = pnl;
        first = false;
    }

    if (r.period_trades == 0)
        return;

    r.success_rate = static_cast<double>(r.successful_trades) / static_cast<double>(r.period_trades);
    r.avg_trade_pnl = r.period_pnl / static_cast<double>(r.period_trades);
    if (gross_loss > 0.0) {
        r.profit_factor = gross_profit / gross_loss;
    } else if (gross_profit > 0.0) {
        r.profit_factor.reset();
    }
}

} // namespace

ReportRecord snapshot(const TradingState& state, const RiskLimits& limits, Timestamp now_ns,
                      Timestamp period_start_ns) {
    ReportRecord r;
    r.timestamp = now_ns;
    r.mode = state.mode;
    r.capital = state.capital;
    r.usable_capital = usable_capital(state.capital, limits);
    r.peak_capital = state.peak_capital;
    r.drawdown = state.drawdown;
    r.daily_pnl = state.daily_pnl;
    r.open_position_count = state.open_position_count();
    r.trade_count = state.trade_history.size();
    r.win_count = static_cast<size_t>(std::count_if(state.trade_history.begin(), state.trade_history.end(),
                                                    [](const TradeRecord& t) { return t.outcome == TradeOutcome::Win; }));
    r.halt_reason = state.halt_reason;
    r.period_start = period_start_ns;
    summarize_period(state, period_start_ns, now_ns, r);
    return r;
}

void to_json(nlohmann::json& j, const ReportRecord& record) {
    j = nlohmann::json{
        {"timestamp", record.timestamp},
        {"mode", mode_to_string(record.mode)},
        {"capital", record.capital},
        {"usableCapital", record.usable_capital},
        {"peakCapital", record.peak_capital},
        {"drawdown", record.drawdown},
        {"dailyPnL", record.daily_pnl},
        {"openPositionCount", record.open_position_count},
        {"tradeCount", record.trade_count},
        {"winCount", record.win_count},
        {"haltReason", halt_reason_str(record.halt_reason)},
        {"summary",
         {
             {"periodStart", record.period_start},
             {"periodEnd", record.timestamp},
             {"totalTrades", record.period_trades},
             {"successfulTrades", record.successful_trades},
             {"failedTrades", record.failed_trades},
             {"successRate", record.success_rate},
             {"totalPnL", record.period_pnl},
         }},
        {"performance",
         {
             {"avgTradePnL", record.avg_trade_pnl},
             {"maxProfit", record.max_profit},
             {"maxLoss", record.max_loss},
             {"profitFactor", record.profit_factor ? nlohmann::json(*record.profit_factor) : nlohmann::json(nullptr)},
         }},
    };
}

Reporter::Reporter(Timestamp interval_ns, Sink sink, logging::AsyncLogger* logger)
    : interval_ns_(interval_ns), sink_(std::move(sink)), logger_(logger) {}

bool Reporter::due(Timestamp now_ns) const {
    if (!has_emitted_)
        return true;
    return now_ns >= last_emit_ns_ + interval_ns_;
}

bool Reporter::emit(const TradingState& state, const RiskLimits& limits, Timestamp now_ns) {
    // Each period starts right after the previous report
    Timestamp period_start = has_emitted_ ? last_emit_ns_ + 1 : 0;
    ReportRecord record = snapshot(state, limits, now_ns, period_start);
    last_emit_ns_ = now_ns;
    has_emitted_ = true;

    try {
        nlohmann::json j = record;
        if (sink_) {
            sink_(j.dump());
        }
    } catch (const std::exception& e) {
        failures_++;
        RISKGOV_LOGF(logger_, Error, Report, "report sink failed: %s", e.what());
        return false;
    }

    emitted_++;
    RISKGOV_LOGF(logger_, Info, Report, "report %s capital=%.2f drawdown=%.4f trades=%zu period_trades=%zu pnl=%.2f",
                 mode_to_string(record.mode), record.capital, record.drawdown, record.trade_count,
                 record.period_trades, record.period_pnl);
    return true;
}

// =============================================================================
// Sinks
// =============================================================================

namespace {

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string());
    }
    out << contents << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

} // namespace

Reporter::Sink Reporter::file_sink(const std::string& directory) {
    return [dir = std::filesystem::path(directory)](const std::string& report) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("cannot create report directory " + dir.string() + ": " + ec.message());
        }

        // Name after the report's own timestamp so replays are reproducible
        nlohmann::json j = nlohmann::json::parse(report);
        Timestamp ts = j.value("timestamp", Timestamp{0});
        std::string pretty = j.dump(2);

        write_file(dir / (std::string(config::reporting::REPORT_FILE_PREFIX) + util::utc_compact(ts) + ".json"),
                   pretty);

        // Replace latest atomically so readers never see a partial file
        std::filesystem::path latest = dir / config::reporting::LATEST_REPORT_FILE;
        std::filesystem::path tmp = latest;
        tmp += ".tmp";
        write_file(tmp, pretty);
        std::filesystem::rename(tmp, latest, ec);
        if (ec) {
            throw std::runtime_error("cannot replace " + latest.string() + ": " + ec.message());
        }
    };
}

Reporter::Sink Reporter::tee(std::vector<Sink> sinks) {
    return [sinks = std::move(sinks)](const std::string& report) {
        std::exception_ptr first_error;
        for (const auto& sink : sinks) {
            try {
                sink(report);
            } catch (const std::exception&) {
                if (!first_error)
                    first_error = std::current_exception();
            }
        }
        if (first_error)
            std::rethrow_exception(first_error);
    };
}

} // namespace riskgov::trading
