#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the governor.
 *
 * All default values are defined here to avoid duplication across:
 * - Config (struct initializers)
 * - Environment / JSON loaders
 * - CLI help text
 *
 * Naming:
 * - _FRACTION suffix: fraction as decimal (0.05 = 5%)
 * - _MS / _SEC suffix: durations
 */

namespace riskgov::config {

// =============================================================================
// Account
// =============================================================================
namespace account {
constexpr double INITIAL_CAPITAL = 10000.0;
} // namespace account

// =============================================================================
// Risk Limits
// =============================================================================
namespace risk {
constexpr double CAPITAL_CAP_FRACTION = 0.50;     // Use max 50% of total capital
constexpr double MAX_POSITION_FRACTION = 0.05;    // Max 5% of usable capital per trade
constexpr uint32_t MAX_TRADES_PER_HOUR = 100;
constexpr double HARD_STOP_LOSS_DRAWDOWN = 0.30;  // HALT at 30% drawdown
constexpr double MAX_DAILY_LOSS_FRACTION = 0.50;  // Reject at 50% daily loss
constexpr bool KILL_SWITCH_ENABLED = true;
} // namespace risk

// =============================================================================
// Promotion (PAPER -> LIVE_LIMITED)
// =============================================================================
namespace promotion {
constexpr double MIN_RUNTIME_MINUTES = 60.0;
constexpr uint32_t MIN_TRADE_COUNT = 30;
constexpr double MIN_WIN_RATE = 0.70;
} // namespace promotion

// =============================================================================
// Execution
// =============================================================================
namespace execution {
// Paper commission (taker-fee equivalent)
constexpr double PAPER_COMMISSION_RATE = 0.001; // 0.1%

// Retry policy for transport failures
constexpr uint32_t RETRY_ATTEMPTS = 3;
constexpr uint32_t RETRY_BASE_DELAY_MS = 200;
constexpr uint32_t RETRY_MAX_DELAY_MS = 2000;

// Bounded timeout for every platform call
constexpr uint32_t REQUEST_TIMEOUT_SEC = 10;

// Live fill confirmation: status polls after SendOrder, then cancel
constexpr uint32_t FILL_POLL_ATTEMPTS = 5;
constexpr uint32_t FILL_POLL_INTERVAL_MS = 500;
} // namespace execution

// =============================================================================
// Reporting
// =============================================================================
namespace reporting {
constexpr uint32_t INTERVAL_SEC = 3600; // hourly
constexpr const char* LATEST_REPORT_FILE = "latest_report.json";
constexpr const char* REPORT_FILE_PREFIX = "report_"; // report_YYYYmmdd_HHMMSS.json
} // namespace reporting

// =============================================================================
// Live exchange
// =============================================================================
namespace live {
constexpr const char* BASE_URL = "https://api.ndax.io";
constexpr int OMS_ID = 1;
} // namespace live

} // namespace riskgov::config
