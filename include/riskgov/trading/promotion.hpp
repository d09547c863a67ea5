#pragma once

/**
 * PromotionEngine - paper performance tracking for PAPER -> LIVE_LIMITED
 *
 * Eligible iff, since the paper run started:
 *   runtime_minutes >= minRuntimeMinutes
 *   trade_count     >= minTradeCount
 *   win_count / trade_count >= minWinRate
 *
 * trade_count counts scored attempts: closing fills (Win or Loss) plus
 * Rejected and Failed. Opening fills are tracked separately and never
 * scored, so a run of entries cannot make the engine eligible.
 *
 * Eligibility is advisory. The engine never changes mode; the state machine
 * additionally requires the operator's liveTradingAuthorized flag.
 */

#include "../config/config.hpp"
#include "../types.hpp"
#include "trading_state.hpp"

#include <cstdint>

namespace riskgov {
namespace trading {

class PromotionEngine {
public:
    PromotionEngine() = default;

    /**
     * Begin a paper run at start_ns. Clears counters.
     */
    void start(Timestamp start_ns);

    /**
     * Record one resolved execution attempt.
     * Win counts as a win; Loss, Rejected and Failed count against the rate;
     * Opened is counted in opened_count only.
     */
    void record_outcome(TradeOutcome outcome);

    bool is_eligible(const PromotionCriteria& criteria, Timestamp now_ns) const;

    double runtime_minutes(Timestamp now_ns) const;
    double win_rate() const;
    uint32_t trade_count() const { return trade_count_; }
    uint32_t win_count() const { return win_count_; }
    uint32_t opened_count() const { return opened_count_; }
    Timestamp start_time() const { return start_ns_; }

private:
    Timestamp start_ns_ = 0;
    uint32_t trade_count_ = 0;
    uint32_t win_count_ = 0;
    uint32_t opened_count_ = 0;
};

} // namespace trading
} // namespace riskgov
