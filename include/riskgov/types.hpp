#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace riskgov {

using OrderId = uint64_t;
using Timestamp = uint64_t; // nanoseconds
using Symbol = std::string; // e.g. "BTC/CAD"

constexpr OrderId INVALID_ORDER_ID = 0;

constexpr Timestamp NS_PER_SECOND = 1'000'000'000ULL;
constexpr Timestamp NS_PER_MINUTE = 60 * NS_PER_SECOND;
constexpr Timestamp NS_PER_HOUR = 60 * NS_PER_MINUTE;
constexpr Timestamp NS_PER_DAY = 24 * NS_PER_HOUR;

enum class Side : uint8_t { Buy = 0, Sell = 1 };

inline const char* side_to_string(Side side) {
    return side == Side::Buy ? "buy" : "sell";
}

/**
 * Trading mode.
 *
 * Every switch over Mode must be exhaustive (no default branch) so that a new
 * state is flagged by -Wswitch at every use site.
 */
enum class Mode : uint8_t { Paper = 0, LiveLimited = 1, Halted = 2 };

inline const char* mode_to_string(Mode mode) {
    switch (mode) {
    case Mode::Paper:
        return "PAPER";
    case Mode::LiveLimited:
        return "LIVE_LIMITED";
    case Mode::Halted:
        return "HALTED";
    }
    return "UNKNOWN";
}

/**
 * Parse "PAPER" / "LIVE_LIMITED" / "HALTED" (case-insensitive).
 * @return false if the string names no mode
 */
bool parse_mode(const std::string& s, Mode& out);

enum class OrderStatus : uint8_t { Pending = 0, Filled = 1, Rejected = 2, Failed = 3 };

inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
    case OrderStatus::Pending:
        return "pending";
    case OrderStatus::Filled:
        return "filled";
    case OrderStatus::Rejected:
        return "rejected";
    case OrderStatus::Failed:
        return "failed";
    }
    return "unknown";
}

/**
 * Machine-readable reason attached to every rejection, halt and failure.
 * Strings are stable; dashboards key on them.
 */
enum class ReasonCode : uint8_t {
    None = 0,
    ModeHalted,
    DrawdownExceeded,
    DailyLossLimit,
    RateLimited,
    PositionTooLarge,
    InvalidSignal,
    NetworkError,
    UnknownResponse,
    ExchangeRejected,
    NoLiveClient,
    KillSwitch,
    OperatorReset,
    OrderUnfilled
};

inline const char* reason_to_string(ReasonCode reason) {
    switch (reason) {
    case ReasonCode::None:
        return "none";
    case ReasonCode::ModeHalted:
        return "mode_halted";
    case ReasonCode::DrawdownExceeded:
        return "drawdown_exceeded";
    case ReasonCode::DailyLossLimit:
        return "daily_loss_limit";
    case ReasonCode::RateLimited:
        return "rate_limited";
    case ReasonCode::PositionTooLarge:
        return "position_too_large";
    case ReasonCode::InvalidSignal:
        return "invalid_signal";
    case ReasonCode::NetworkError:
        return "network_error";
    case ReasonCode::UnknownResponse:
        return "unknown_response";
    case ReasonCode::ExchangeRejected:
        return "exchange_rejected";
    case ReasonCode::NoLiveClient:
        return "no_live_client";
    case ReasonCode::KillSwitch:
        return "kill_switch";
    case ReasonCode::OperatorReset:
        return "operator_reset";
    case ReasonCode::OrderUnfilled:
        return "order_unfilled";
    }
    return "unknown";
}

/**
 * Trading signal - external input, produced by a strategy.
 *
 * requested_size is a notional amount in account currency; the order
 * quantity is requested_size / price.
 */
struct Signal {
    Symbol symbol;
    Side action = Side::Buy;
    double price = 0.0;
    double confidence = 0.0; // [0, 1]
    double requested_size = 0.0;
};

/**
 * Order produced by the Executor for an approved signal.
 */
struct Order {
    OrderId id = INVALID_ORDER_ID;
    Symbol symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    OrderStatus status = OrderStatus::Pending;
    Timestamp timestamp = 0;
    ReasonCode reason = ReasonCode::None;
    std::string error; // exchange/transport detail, empty on success
};

} // namespace riskgov
