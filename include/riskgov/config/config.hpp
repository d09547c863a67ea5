#pragma once

/**
 * Config - immutable run configuration.
 *
 * Built once per run from (in increasing priority):
 *   1. defaults.hpp
 *   2. JSON file      (Config::from_json_file)
 *   3. environment    (Config::apply_env)
 *   4. CLI flags      (util::apply_cli)
 *
 * After validate() the snapshot is shared as std::shared_ptr<const Config>.
 * Components never mutate it; a new snapshot replaces the old one.
 */

#include "../types.hpp"
#include "defaults.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace riskgov {

struct RiskLimits {
    double capital_cap_fraction = config::risk::CAPITAL_CAP_FRACTION;
    double max_position_fraction = config::risk::MAX_POSITION_FRACTION;
    uint32_t max_trades_per_hour = config::risk::MAX_TRADES_PER_HOUR;
    double hard_stop_loss_drawdown = config::risk::HARD_STOP_LOSS_DRAWDOWN;
    double max_daily_loss_fraction = config::risk::MAX_DAILY_LOSS_FRACTION;
    bool kill_switch_enabled = config::risk::KILL_SWITCH_ENABLED;
};

struct PromotionCriteria {
    double min_runtime_minutes = config::promotion::MIN_RUNTIME_MINUTES;
    uint32_t min_trade_count = config::promotion::MIN_TRADE_COUNT;
    double min_win_rate = config::promotion::MIN_WIN_RATE;
};

struct ExecutionSettings {
    double paper_commission_rate = config::execution::PAPER_COMMISSION_RATE;
    uint32_t retry_attempts = config::execution::RETRY_ATTEMPTS;
    uint32_t retry_base_delay_ms = config::execution::RETRY_BASE_DELAY_MS;
    uint32_t retry_max_delay_ms = config::execution::RETRY_MAX_DELAY_MS;
    uint32_t request_timeout_sec = config::execution::REQUEST_TIMEOUT_SEC;
    uint32_t fill_poll_attempts = config::execution::FILL_POLL_ATTEMPTS;
    uint32_t fill_poll_interval_ms = config::execution::FILL_POLL_INTERVAL_MS;
    uint32_t report_interval_sec = config::reporting::INTERVAL_SEC;
    std::string report_dir; // empty: reports go to stdout only
};

struct LiveCredentials {
    std::string api_key;
    std::string api_secret;
    std::string user_id;
    std::string account_id;
    std::string base_url = config::live::BASE_URL;

    bool complete() const { return !api_key.empty() && !api_secret.empty() && !user_id.empty() && !account_id.empty(); }
};

struct Config {
    Mode mode = Mode::Paper;
    bool live_trading_authorized = false;
    double initial_capital = config::account::INITIAL_CAPITAL;

    RiskLimits limits;
    PromotionCriteria promotion;
    ExecutionSettings execution;
    LiveCredentials live;

    /**
     * Check ranges. Throws ConfigError naming the first offending option.
     * Starting in LIVE_LIMITED requires liveTradingAuthorized.
     */
    void validate() const;

    /**
     * Overlay options present in a JSON document onto this config.
     * Unknown keys are ignored; wrongly typed values throw ConfigError.
     * Counts must be integer literals within [0, 2^32).
     *
     * Recognized keys (camelCase, matching the documented option names):
     *   mode, liveTradingAuthorized, initialCapital,
     *   capitalCapFraction, maxPositionFraction, maxTradesPerHour,
     *   hardStopLossDrawdown, maxDailyLossFraction, killSwitchEnabled,
     *   minRuntimeMinutes, minTradeCount, minWinRate,
     *   paperCommissionRate, retryAttempts, retryBaseDelayMs,
     *   retryMaxDelayMs, requestTimeoutSec, fillPollAttempts,
     *   fillPollIntervalMs, reportIntervalSec, reportDir,
     *   live: { apiKey, apiSecret, userId, accountId, baseUrl }
     */
    void apply_json(const nlohmann::json& doc);

    /**
     * Overlay environment variables (TRADING_MODE, LIVE_TRADING_AUTHORIZED,
     * CAPITAL_CAP_FRACTION, ..., NDAX_API_KEY, NDAX_BASE_URL, REPORTING_INTERVAL).
     */
    void apply_env();

    static Config defaults() { return Config{}; }
    static Config from_json_file(const std::string& path);
};

using ConfigPtr = std::shared_ptr<const Config>;

/**
 * Derived: the part of capital the governor permits to be put at risk.
 */
inline double usable_capital(double capital, const RiskLimits& limits) {
    return capital * limits.capital_cap_fraction;
}

/**
 * Derived: largest notional a single order may request.
 */
inline double max_position_size(double capital, const RiskLimits& limits) {
    return limits.max_position_fraction * usable_capital(capital, limits);
}

} // namespace riskgov
