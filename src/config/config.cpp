#include "../../include/riskgov/config/config.hpp"
#include "../../include/riskgov/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace riskgov {

using json = nlohmann::json;

bool parse_mode(const std::string& s, Mode& out) {
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper == "PAPER") {
        out = Mode::Paper;
        return true;
    }
    if (upper == "LIVE_LIMITED") {
        out = Mode::LiveLimited;
        return true;
    }
    if (upper == "HALTED") {
        out = Mode::Halted;
        return true;
    }
    return false;
}

namespace {

void require_fraction(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError(std::string(name) + " must be within [0, 1], got " + std::to_string(value));
    }
}

template <typename T>
void read_json(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null())
        return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad value for ") + key + ": " + e.what());
    }
}

// Counts: integer literals only. get<uint32_t>() would wrap -1 and truncate 2.9.
void read_json(const json& doc, const char* key, uint32_t& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null())
        return;
    if (!it->is_number_integer()) {
        throw ConfigError(std::string(key) + " must be a non-negative integer, got " + it->dump());
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError(std::string(key) + " is out of range: " + it->dump());
        }
        out = static_cast<uint32_t>(value);
        return;
    }
    int64_t value = it->get<int64_t>();
    if (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ConfigError(std::string(key) + " must be a non-negative integer, got " + it->dump());
    }
    out = static_cast<uint32_t>(value);
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void env_double(const char* name, double& out) {
    const char* v = env(name);
    if (!v)
        return;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != std::string(v).size())
            throw ConfigError(std::string(name) + " is not a number: " + v);
        out = parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a number: " + v);
    }
}

void env_uint(const char* name, uint32_t& out) {
    const char* v = env(name);
    if (!v)
        return;
    try {
        size_t used = 0;
        long long parsed = std::stoll(v, &used);
        if (used != std::string(v).size() || parsed < 0 ||
            parsed > static_cast<long long>(std::numeric_limits<uint32_t>::max()))
            throw ConfigError(std::string(name) + " is not a non-negative integer: " + v);
        out = static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a non-negative integer: " + v);
    }
}

void env_bool(const char* name, bool& out) {
    const char* v = env(name);
    if (!v)
        return;
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
    } else if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
    } else {
        throw ConfigError(std::string(name) + " is not a boolean: " + v);
    }
}

void env_string(const char* name, std::string& out) {
    const char* v = env(name);
    if (v)
        out = v;
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

void Config::validate() const {
    if (!(initial_capital > 0.0)) {
        throw ConfigError("initialCapital must be positive");
    }

    require_fraction(limits.capital_cap_fraction, "capitalCapFraction");
    require_fraction(limits.max_position_fraction, "maxPositionFraction");
    require_fraction(limits.hard_stop_loss_drawdown, "hardStopLossDrawdown");
    require_fraction(limits.max_daily_loss_fraction, "maxDailyLossFraction");

    if (promotion.min_runtime_minutes < 0.0) {
        throw ConfigError("minRuntimeMinutes must be non-negative");
    }
    require_fraction(promotion.min_win_rate, "minWinRate");

    if (execution.paper_commission_rate < 0.0 || execution.paper_commission_rate >= 1.0) {
        throw ConfigError("paperCommissionRate must be within [0, 1)");
    }
    if (execution.retry_attempts == 0) {
        throw ConfigError("retryAttempts must be at least 1");
    }
    if (execution.retry_base_delay_ms > execution.retry_max_delay_ms) {
        throw ConfigError("retryBaseDelayMs must not exceed retryMaxDelayMs");
    }
    if (execution.request_timeout_sec == 0) {
        throw ConfigError("requestTimeoutSec must be positive");
    }
    if (execution.fill_poll_attempts == 0) {
        throw ConfigError("fillPollAttempts must be at least 1");
    }
    if (execution.report_interval_sec == 0) {
        throw ConfigError("reportIntervalSec must be positive");
    }

    // Live execution needs both the mode and the operator's authorization
    if (mode == Mode::LiveLimited && !live_trading_authorized) {
        throw ConfigError("mode LIVE_LIMITED requires liveTradingAuthorized");
    }
}

// =============================================================================
// JSON
// =============================================================================

void Config::apply_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration document must be a JSON object");
    }

    std::string mode_str;
    read_json(doc, "mode", mode_str);
    if (!mode_str.empty() && !parse_mode(mode_str, mode)) {
        throw ConfigError("unknown mode: " + mode_str);
    }

    read_json(doc, "liveTradingAuthorized", live_trading_authorized);
    read_json(doc, "initialCapital", initial_capital);

    read_json(doc, "capitalCapFraction", limits.capital_cap_fraction);
    read_json(doc, "maxPositionFraction", limits.max_position_fraction);
    read_json(doc, "maxTradesPerHour", limits.max_trades_per_hour);
    read_json(doc, "hardStopLossDrawdown", limits.hard_stop_loss_drawdown);
    read_json(doc, "maxDailyLossFraction", limits.max_daily_loss_fraction);
    read_json(doc, "killSwitchEnabled", limits.kill_switch_enabled);

    read_json(doc, "minRuntimeMinutes", promotion.min_runtime_minutes);
    read_json(doc, "minTradeCount", promotion.min_trade_count);
    read_json(doc, "minWinRate", promotion.min_win_rate);

    read_json(doc, "paperCommissionRate", execution.paper_commission_rate);
    read_json(doc, "retryAttempts", execution.retry_attempts);
    read_json(doc, "retryBaseDelayMs", execution.retry_base_delay_ms);
    read_json(doc, "retryMaxDelayMs", execution.retry_max_delay_ms);
    read_json(doc, "requestTimeoutSec", execution.request_timeout_sec);
    read_json(doc, "fillPollAttempts", execution.fill_poll_attempts);
    read_json(doc, "fillPollIntervalMs", execution.fill_poll_interval_ms);
    read_json(doc, "reportIntervalSec", execution.report_interval_sec);
    read_json(doc, "reportDir", execution.report_dir);

    auto it = doc.find("live");
    if (it != doc.end() && it->is_object()) {
        read_json(*it, "apiKey", live.api_key);
        read_json(*it, "apiSecret", live.api_secret);
        read_json(*it, "userId", live.user_id);
        read_json(*it, "accountId", live.account_id);
        read_json(*it, "baseUrl", live.base_url);
    }
}

Config Config::from_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }

    Config cfg;
    cfg.apply_json(doc);
    return cfg;
}

// =============================================================================
// Environment
// =============================================================================

void Config::apply_env() {
    if (const char* m = env("TRADING_MODE")) {
        if (!parse_mode(m, mode)) {
            throw ConfigError(std::string("unknown TRADING_MODE: ") + m);
        }
    }
    env_bool("LIVE_TRADING_AUTHORIZED", live_trading_authorized);
    env_double("INITIAL_CAPITAL", initial_capital);

    env_double("CAPITAL_CAP_FRACTION", limits.capital_cap_fraction);
    env_double("MAX_POSITION_FRACTION", limits.max_position_fraction);
    env_uint("MAX_TRADES_PER_HOUR", limits.max_trades_per_hour);
    env_double("HARD_STOP_LOSS_DRAWDOWN", limits.hard_stop_loss_drawdown);
    env_double("MAX_DAILY_LOSS_FRACTION", limits.max_daily_loss_fraction);
    env_bool("KILL_SWITCH_ENABLED", limits.kill_switch_enabled);

    env_double("MIN_RUNTIME_MINUTES", promotion.min_runtime_minutes);
    env_uint("MIN_TRADE_COUNT", promotion.min_trade_count);
    env_double("MIN_WIN_RATE", promotion.min_win_rate);

    env_double("PAPER_COMMISSION_RATE", execution.paper_commission_rate);
    env_uint("RETRY_ATTEMPTS", execution.retry_attempts);
    env_uint("REQUEST_TIMEOUT_SEC", execution.request_timeout_sec);
    env_uint("FILL_POLL_ATTEMPTS", execution.fill_poll_attempts);
    env_uint("FILL_POLL_INTERVAL_MS", execution.fill_poll_interval_ms);
    env_uint("REPORTING_INTERVAL", execution.report_interval_sec);
    env_string("REPORT_DIR", execution.report_dir);

    env_string("NDAX_API_KEY", live.api_key);
    env_string("NDAX_API_SECRET", live.api_secret);
    env_string("NDAX_USER_ID", live.user_id);
    env_string("NDAX_ACCOUNT_ID", live.account_id);
    env_string("NDAX_BASE_URL", live.base_url);
}

} // namespace riskgov
