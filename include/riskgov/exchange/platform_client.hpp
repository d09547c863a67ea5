#pragma once

#include "../errors.hpp"
#include "../types.hpp"

#include <cmath>
#include <map>
#include <string>
#include <utility>

namespace riskgov {
namespace exchange {

/**
 * Order request handed to a PlatformClient.
 */
struct OrderRequest {
    Symbol symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    Timestamp timestamp = 0;
};

/**
 * Result of place_order. Exchange rejections are thrown (RejectedError),
 * so status here is Filled or Pending.
 */
struct PlaceOrderResponse {
    OrderId order_id = INVALID_ORDER_ID;
    OrderStatus status = OrderStatus::Pending;
    double filled_quantity = 0.0;
    double filled_price = 0.0;
    double commission = 0.0;
    std::string error;
};

using Balances = std::map<std::string, double>; // currency -> amount

/**
 * PlatformClient - capability interface for paper and live execution
 *
 * Implemented by:
 * - PaperSimulator (in-memory, deterministic, never touches the network)
 * - LiveClient     (authenticated REST calls to the exchange)
 *
 * Failure contract:
 * - ValidationError before any I/O for malformed input
 * - NetworkError on transport failure (caller may retry)
 * - ParseError on malformed response (value unknown, not zero)
 * - RejectedError when the counterparty declines an order
 */
class PlatformClient {
public:
    virtual ~PlatformClient() = default;

    virtual Balances get_balance() = 0;
    virtual double get_price(const Symbol& symbol) = 0;
    virtual PlaceOrderResponse place_order(const OrderRequest& request) = 0;
    virtual bool cancel_order(OrderId order_id) = 0;

    /// Human-readable name for logs ("paper", "ndax-live")
    virtual const char* name() const = 0;
};

/**
 * Shared pre-I/O validation for order requests.
 * Throws ValidationError naming the first malformed field.
 */
inline void validate_order_request(const OrderRequest& request) {
    if (request.symbol.empty()) {
        throw ValidationError("order symbol is empty");
    }
    if (request.side != Side::Buy && request.side != Side::Sell) {
        throw ValidationError("order side is missing");
    }
    if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
        throw ValidationError("order quantity must be positive");
    }
    if (!std::isfinite(request.price) || request.price <= 0.0) {
        throw ValidationError("order price must be positive");
    }
}

/**
 * Split "BTC/CAD" into base and quote currency.
 * Symbols without '/' are returned as base with empty quote.
 */
inline std::pair<std::string, std::string> split_symbol(const Symbol& symbol) {
    auto slash = symbol.find('/');
    if (slash == std::string::npos) {
        return {symbol, std::string()};
    }
    return {symbol.substr(0, slash), symbol.substr(slash + 1)};
}

} // namespace exchange
} // namespace riskgov
