#include "../../include/riskgov/exchange/paper_simulator.hpp"

namespace riskgov::exchange {

PaperSimulator::PaperSimulator(double commission_rate)
    : commission_rate_(commission_rate)
    , next_order_id_(1)
    , total_orders_(0)
    , total_fills_(0)
    , total_commission_(0.0) {}

void PaperSimulator::set_balance(const std::string& currency, double amount) {
    balances_[currency] = amount;
}

void PaperSimulator::set_price(const Symbol& symbol, double price) {
    prices_[symbol] = price;
}

Balances PaperSimulator::get_balance() {
    return balances_;
}

double PaperSimulator::get_price(const Symbol& symbol) {
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        throw ValidationError("no paper price for " + symbol);
    }
    return it->second;
}

PlaceOrderResponse PaperSimulator::place_order(const OrderRequest& request) {
    validate_order_request(request);

    total_orders_++;
    OrderId order_id = next_order_id_++;

    // Fill at the requested price, in full
    double notional = request.quantity * request.price;
    double commission = notional * commission_rate_;

    // Settle balances: commission is taken in the quote currency
    auto [base, quote] = split_symbol(request.symbol);
    if (request.side == Side::Buy) {
        balances_[base] += request.quantity;
        if (!quote.empty())
            balances_[quote] -= notional + commission;
    } else {
        balances_[base] -= request.quantity;
        if (!quote.empty())
            balances_[quote] += notional - commission;
    }

    prices_[request.symbol] = request.price;
    total_fills_++;
    total_commission_ += commission;

    PlaceOrderResponse response;
    response.order_id = order_id;
    response.status = OrderStatus::Filled;
    response.filled_quantity = request.quantity;
    response.filled_price = request.price;
    response.commission = commission;
    return response;
}

bool PaperSimulator::cancel_order(OrderId /*order_id*/) {
    // Every paper order fills on submission; nothing is ever resting
    return false;
}

} // namespace riskgov::exchange
