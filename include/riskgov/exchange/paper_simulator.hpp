#pragma once

#include "platform_client.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace riskgov {
namespace exchange {

/**
 * PaperSimulator - Simulated exchange for paper trading
 *
 * Produces PlaceOrderResponse values identical in shape to the live client.
 * The Executor processes both without knowing the source.
 *
 * Features:
 * - Orders fill instantly and in full at the requested price (no slippage,
 *   no queue model; this is a control path, not a market simulator)
 * - Commission charged on notional (configurable, default 0.1%)
 * - Per-currency balances settled on every fill
 * - Deterministic, monotonically increasing order ids starting at 1
 * - No network code: nothing here can reach a transport
 */
class PaperSimulator : public PlatformClient {
public:
    explicit PaperSimulator(double commission_rate = 0.001);

    // Seed a balance (e.g. "CAD" -> 10000)
    void set_balance(const std::string& currency, double amount);

    // Set the reference price returned by get_price
    void set_price(const Symbol& symbol, double price);

    Balances get_balance() override;
    double get_price(const Symbol& symbol) override;
    PlaceOrderResponse place_order(const OrderRequest& request) override;
    bool cancel_order(OrderId order_id) override;
    const char* name() const override { return "paper"; }

    // Accessors
    uint64_t total_orders() const { return total_orders_; }
    uint64_t total_fills() const { return total_fills_; }
    double total_commission() const { return total_commission_; }
    OrderId next_order_id() const { return next_order_id_; }
    double commission_rate() const { return commission_rate_; }

private:
    double commission_rate_;
    OrderId next_order_id_;
    uint64_t total_orders_;
    uint64_t total_fills_;
    double total_commission_;
    Balances balances_;
    std::map<Symbol, double> prices_;
};

} // namespace exchange
} // namespace riskgov
