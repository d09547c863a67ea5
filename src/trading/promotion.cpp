#include "../../include/riskgov/trading/promotion.hpp"

namespace riskgov::trading {

void PromotionEngine::start(Timestamp start_ns) {
    start_ns_ = start_ns;
    trade_count_ = 0;
    win_count_ = 0;
    opened_count_ = 0;
}

void PromotionEngine::record_outcome(TradeOutcome outcome) {
    if (outcome == TradeOutcome::Opened) {
        opened_count_++;
        return;
    }
    trade_count_++;
    if (outcome == TradeOutcome::Win) {
        win_count_++;
    }
}

double PromotionEngine::runtime_minutes(Timestamp now_ns) const {
    if (now_ns <= start_ns_)
        return 0.0;
    return static_cast<double>(now_ns - start_ns_) / static_cast<double>(NS_PER_MINUTE);
}

double PromotionEngine::win_rate() const {
    return trade_count_ > 0 ? static_cast<double>(win_count_) / trade_count_ : 0.0;
}

bool PromotionEngine::is_eligible(const PromotionCriteria& criteria, Timestamp now_ns) const {
    if (runtime_minutes(now_ns) < criteria.min_runtime_minutes)
        return false;
    if (trade_count_ < criteria.min_trade_count)
        return false;
    // No trades: win rate undefined, never eligible
    if (trade_count_ == 0)
        return false;
    return win_rate() >= criteria.min_win_rate;
}

} // namespace riskgov::trading
