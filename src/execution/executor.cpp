#include "../../include/riskgov/execution/executor.hpp"
#include "../../include/riskgov/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace riskgov::execution {

using trading::Governor;
using trading::ModeInputs;
using trading::ModeTransition;
using trading::RiskDecision;
using trading::TradeOutcome;
using trading::TradeRecord;

namespace {

ReasonCode halt_reason_code(trading::HaltReason reason) {
    switch (reason) {
    case trading::HaltReason::Drawdown:
        return ReasonCode::DrawdownExceeded;
    case trading::HaltReason::KillSwitch:
        return ReasonCode::KillSwitch;
    case trading::HaltReason::None:
    case trading::HaltReason::Configured:
        return ReasonCode::ModeHalted;
    }
    return ReasonCode::ModeHalted;
}

} // namespace

Executor::Executor(ConfigPtr config, trading::TradingState& state, trading::PromotionEngine& promotion,
                   exchange::PlatformClient& paper, exchange::PlatformClient* live,
                   const trading::KillSwitch* kill_switch, logging::AsyncLogger* logger, Timestamp start_ns)
    : config_(std::move(config))
    , state_(state)
    , promotion_(promotion)
    , paper_(paper)
    , live_(live)
    , kill_switch_(kill_switch)
    , logger_(logger)
    , cycle_count_(0) {
    if (!config_) {
        throw ConfigError("executor requires a config snapshot");
    }
    promotion_.start(start_ns);
}

bool Executor::validate_signal(const Signal& signal) {
    if (signal.symbol.empty())
        return false;
    if (!std::isfinite(signal.price) || signal.price <= 0.0)
        return false;
    if (!std::isfinite(signal.requested_size) || signal.requested_size <= 0.0)
        return false;
    if (!(signal.confidence >= 0.0 && signal.confidence <= 1.0))
        return false;
    return signal.action == Side::Buy || signal.action == Side::Sell;
}

// =============================================================================
// Cycle
// =============================================================================

CycleResult Executor::execute_cycle(const std::optional<Signal>& signal, Timestamp now_ns) {
    cycle_count_++;

    CycleResult result;
    result.delta.capital_before = state_.capital;

    // 1. Mode transitions, before the signal is looked at
    result.transition = evaluate_mode(now_ns);
    apply_transition(result.transition, now_ns);

    if (signal) {
        // 2. Shape, then risk
        if (result.transition.changed() && result.transition.to == Mode::Halted) {
            // The signal that arrives with a halt is rejected with the halt's cause
            RiskDecision decision = RiskDecision::reject(halt_reason_code(result.transition.halt_reason));
            decision.halt_requested = result.transition.halt_reason == trading::HaltReason::Drawdown;
            result.decision = decision;
            result.reason = decision.reason;
            RISKGOV_LOGF(logger_, Warn, Risk, "reject %s %s: %s", side_to_string(signal->action),
                         signal->symbol.c_str(), reason_to_string(decision.reason));
        } else if (!validate_signal(*signal)) {
            result.decision = RiskDecision::reject(ReasonCode::InvalidSignal);
            result.reason = ReasonCode::InvalidSignal;
            RISKGOV_LOGF(logger_, Warn, Risk, "reject %s: %s", signal->symbol.c_str(),
                         reason_to_string(ReasonCode::InvalidSignal));
        } else {
            RiskDecision decision = Governor::evaluate(*signal, state_, config_->limits, now_ns);
            result.decision = decision;

            if (decision.halt_requested) {
                ModeTransition t{state_.mode, Mode::Halted, trading::HaltReason::Drawdown};
                apply_transition(t, now_ns);
            }

            if (decision.approved) {
                // 3-6
                dispatch(*signal, now_ns, result);
            } else {
                result.reason = decision.reason;
                RISKGOV_LOGF(logger_, Warn, Risk, "reject %s %s size=%.2f: %s", side_to_string(signal->action),
                             signal->symbol.c_str(), signal->requested_size, reason_to_string(decision.reason));
            }
        }
    }

    result.delta.capital_after = state_.capital;
    return result;
}

ModeTransition Executor::evaluate_mode(Timestamp now_ns) {
    trading::prune_trade_window(state_, now_ns);
    trading::recompute_drawdown(state_);

    const Config& cfg = *config_;

    ModeInputs in;
    in.drawdown_breached = trading::drawdown_breached(state_, cfg.limits);
    in.kill_switch = cfg.limits.kill_switch_enabled && kill_switch_ && kill_switch_->asserted();
    in.live_authorized = cfg.live_trading_authorized;
    // Promotion is only considered under operator authorization, and only
    // when there is a live client to route to
    if (state_.mode == Mode::Paper && in.live_authorized && live_ != nullptr) {
        in.promotion_eligible = promotion_.is_eligible(cfg.promotion, now_ns);
    }

    return trading::next_mode(state_.mode, in);
}

void Executor::apply_transition(const ModeTransition& t, Timestamp now_ns) {
    if (!t.changed())
        return;

    switch (t.to) {
    case Mode::Halted:
        trading::trigger_halt(state_, t.halt_reason, now_ns);
        RISKGOV_LOGF(logger_, Warn, Mode, "%s -> HALTED (%s) capital=%.2f drawdown=%.4f", mode_to_string(t.from),
                     trading::halt_reason_str(t.halt_reason), state_.capital, state_.drawdown);
        break;
    case Mode::LiveLimited:
        state_.mode = Mode::LiveLimited;
        RISKGOV_LOGF(logger_, Warn, Mode, "PAPER -> LIVE_LIMITED trades=%u win_rate=%.3f runtime=%.1fmin",
                     promotion_.trade_count(), promotion_.win_rate(), promotion_.runtime_minutes(now_ns));
        break;
    case Mode::Paper:
        // Only reached through reset_halt
        state_.mode = Mode::Paper;
        break;
    }
}

exchange::PlatformClient* Executor::select_client(Mode mode) const {
    switch (mode) {
    case Mode::Paper:
        return &paper_;
    case Mode::LiveLimited:
        return live_;
    case Mode::Halted:
        return nullptr;
    }
    return nullptr;
}

void Executor::dispatch(const Signal& signal, Timestamp now_ns, CycleResult& result) {
    Order order;
    order.symbol = signal.symbol;
    order.side = signal.action;
    order.quantity = signal.requested_size / signal.price;
    order.price = signal.price;
    order.timestamp = now_ns;

    exchange::PlatformClient* client = select_client(state_.mode);
    if (!client) {
        order.status = OrderStatus::Failed;
        order.reason = state_.mode == Mode::Halted ? ReasonCode::ModeHalted : ReasonCode::NoLiveClient;
        result.reason = order.reason;
        RISKGOV_LOGF(logger_, Error, Order, "no client for mode %s: %s", mode_to_string(state_.mode),
                     reason_to_string(order.reason));
        result.order = order;
        return;
    }

    exchange::OrderRequest request;
    request.symbol = order.symbol;
    request.side = order.side;
    request.quantity = order.quantity;
    request.price = order.price;
    request.timestamp = now_ns;

    // The call resolves (fill, failure or timeout) before any state changes
    exchange::PlaceOrderResponse response;
    try {
        response = client->place_order(request);
    } catch (const ValidationError& e) {
        // Nothing was sent; terminal for this signal, not an execution attempt
        order.status = OrderStatus::Rejected;
        order.reason = ReasonCode::InvalidSignal;
        order.error = e.what();
        result.reason = order.reason;
        result.order = order;
        RISKGOV_LOGF(logger_, Warn, Order, "%s invalid: %s", client->name(), e.what());
        return;
    } catch (const RejectedError& e) {
        order.status = OrderStatus::Rejected;
        order.reason = ReasonCode::ExchangeRejected;
        order.error = e.what();
        order.id = e.order_id();
    } catch (const UnfilledError& e) {
        order.status = OrderStatus::Failed;
        order.reason = ReasonCode::OrderUnfilled;
        order.error = e.what();
        order.id = e.order_id();
    } catch (const NetworkError& e) {
        order.status = OrderStatus::Failed;
        order.reason = ReasonCode::NetworkError;
        order.error = e.what();
        order.id = e.order_id();
    } catch (const ParseError& e) {
        order.status = OrderStatus::Failed;
        order.reason = ReasonCode::UnknownResponse;
        order.error = e.what();
        order.id = e.order_id();
    } catch (const PlatformError& e) {
        order.status = OrderStatus::Failed;
        order.reason = ReasonCode::NetworkError;
        order.error = e.what();
        order.id = e.order_id();
    }

    if (order.error.empty() && response.status != OrderStatus::Filled) {
        // Accepted but not filled: withdraw it so it cannot fill unaccounted
        order.id = response.order_id;
        order.status = OrderStatus::Failed;
        order.reason = ReasonCode::OrderUnfilled;
        order.error = "order " + std::to_string(order.id) + " not filled";
        try {
            if (!client->cancel_order(order.id))
                order.error += ", cancel not confirmed";
            else
                order.error += ", cancelled";
        } catch (const PlatformError& e) {
            order.error += std::string(", cancel failed: ") + e.what();
        }
    }

    if (!order.error.empty()) {
        // Terminal for this order; recorded so promotion sees execution failures
        TradeOutcome outcome =
            order.status == OrderStatus::Rejected ? TradeOutcome::Rejected : TradeOutcome::Failed;
        record_attempt(order, outcome, 0.0, 0.0, now_ns);
        promotion_.record_outcome(outcome);
        // An order the exchange accepted counts against the rate limit
        if (order.id != INVALID_ORDER_ID) {
            trading::record_order_activity(state_, now_ns);
        }
        result.reason = order.reason;
        result.order = order;
        result.delta.trade_recorded = true;
        RISKGOV_LOGF(logger_, Error, Order, "%s %s %s #%llu %s: %s", client->name(), side_to_string(order.side),
                     order.symbol.c_str(), static_cast<unsigned long long>(order.id), reason_to_string(order.reason),
                     order.error.c_str());
        return;
    }

    order.id = response.order_id;
    order.status = response.status;
    if (!response.error.empty()) {
        RISKGOV_LOGF(logger_, Warn, Order, "%s order %llu: %s", client->name(),
                     static_cast<unsigned long long>(order.id), response.error.c_str());
    }

    order.quantity = response.filled_quantity;
    order.price = response.filled_price;

    double daily_before = state_.daily_pnl;
    trading::FillEffect effect = trading::apply_fill(state_, order.symbol, order.side, order.quantity, order.price,
                                                     response.commission, now_ns);

    // Only a fill that closed exposure has a result, judged net of commission
    TradeOutcome outcome = TradeOutcome::Opened;
    if (effect.closed_quantity > 0.0) {
        outcome = effect.realized_pnl - response.commission > 0.0 ? TradeOutcome::Win : TradeOutcome::Loss;
    }
    record_attempt(order, outcome, response.commission, effect.realized_pnl, now_ns);
    promotion_.record_outcome(outcome);

    result.order = order;
    result.delta.daily_pnl_delta = state_.daily_pnl - daily_before;
    result.delta.realized_pnl = effect.realized_pnl;
    result.delta.trade_recorded = true;

    RISKGOV_LOGF(logger_, Info, Order, "%s fill #%llu %s %.8f %s @ %.2f pnl=%.2f capital=%.2f", client->name(),
                 static_cast<unsigned long long>(order.id), side_to_string(order.side), order.quantity,
                 order.symbol.c_str(), order.price, effect.realized_pnl, state_.capital);
}

void Executor::record_attempt(const Order& order, TradeOutcome outcome, double commission, double realized_pnl,
                              Timestamp now_ns) {
    TradeRecord rec;
    rec.order_id = order.id;
    rec.symbol = order.symbol;
    rec.side = order.side;
    rec.quantity = order.quantity;
    rec.price = order.price;
    rec.notional = order.quantity * order.price;
    rec.commission = commission;
    rec.realized_pnl = realized_pnl;
    rec.outcome = outcome;
    rec.reason = order.reason;
    rec.mode = state_.mode;
    rec.submit_time_ns = order.timestamp;
    rec.resolve_time_ns = now_ns;
    state_.trade_history.push_back(std::move(rec));
}

// =============================================================================
// Operator actions
// =============================================================================

bool Executor::reset_halt(Timestamp now_ns) {
    if (!trading::reset_halt(state_))
        return false;

    // Drawdown is measured from a fresh peak after an operator reset
    state_.peak_capital = state_.capital;
    state_.drawdown = 0.0;
    promotion_.start(now_ns);

    RISKGOV_LOGF(logger_, Warn, Mode, "HALTED -> PAPER (%s) capital=%.2f", reason_to_string(ReasonCode::OperatorReset),
                 state_.capital);
    return true;
}

void Executor::on_daily_boundary() {
    RISKGOV_LOGF(logger_, Info, Risk, "daily boundary, daily_pnl was %.2f", state_.daily_pnl);
    trading::reset_daily_risk(state_);
}

void Executor::replace_config(ConfigPtr config) {
    if (!config) {
        throw ConfigError("replacement config is null");
    }
    config->validate();
    config_ = std::move(config);
    RISKGOV_LOGF(logger_, Info, System, "config replaced, live_authorized=%d", config_->live_trading_authorized ? 1 : 0);
}

} // namespace riskgov::execution
