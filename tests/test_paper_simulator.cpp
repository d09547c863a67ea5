/**
 * PaperSimulator Test Suite
 *
 * Tests the simulated exchange for paper trading:
 * - Instant full fills at the requested price
 * - Commission calculation
 * - Balance settlement
 * - Deterministic order ids
 * - Validation before anything is recorded
 *
 * Run with: ./test_paper_simulator
 */

#include "../include/riskgov/exchange/paper_simulator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace riskgov;
using namespace riskgov::exchange;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

static OrderRequest make_request(Side side, double qty, double price, const Symbol& symbol = "BTC/CAD") {
    OrderRequest r;
    r.symbol = symbol;
    r.side = side;
    r.quantity = qty;
    r.price = price;
    return r;
}

TEST(buy_fills_in_full_at_price) {
    PaperSimulator sim;
    PlaceOrderResponse r = sim.place_order(make_request(Side::Buy, 0.004, 50000.0));

    ASSERT_EQ(r.status, OrderStatus::Filled);
    ASSERT_NEAR(r.filled_quantity, 0.004, 1e-12);
    ASSERT_EQ(r.filled_price, 50000.0);
    ASSERT_NEAR(r.commission, 0.2, 1e-9);
    ASSERT_TRUE(r.error.empty());
}

TEST(order_ids_start_at_one_and_increase) {
    PaperSimulator sim;
    OrderId a = sim.place_order(make_request(Side::Buy, 1.0, 10.0)).order_id;
    OrderId b = sim.place_order(make_request(Side::Sell, 1.0, 10.0)).order_id;

    ASSERT_EQ(a, 1u);
    ASSERT_EQ(b, 2u);
    ASSERT_EQ(sim.next_order_id(), 3u);
    ASSERT_EQ(sim.total_orders(), 2u);
    ASSERT_EQ(sim.total_fills(), 2u);
}

TEST(balances_settle_with_commission) {
    PaperSimulator sim(0.001);
    sim.set_balance("CAD", 10000.0);

    sim.place_order(make_request(Side::Buy, 0.004, 50000.0));
    Balances b = sim.get_balance();
    ASSERT_NEAR(b["BTC"], 0.004, 1e-12);
    ASSERT_NEAR(b["CAD"], 10000.0 - 200.2, 1e-9);

    sim.place_order(make_request(Side::Sell, 0.004, 50000.0));
    b = sim.get_balance();
    ASSERT_NEAR(b["BTC"], 0.0, 1e-12);
    ASSERT_NEAR(b["CAD"], 10000.0 - 0.4, 1e-9);
    ASSERT_NEAR(sim.total_commission(), 0.4, 1e-9);
}

TEST(zero_commission_rate) {
    PaperSimulator sim(0.0);
    PlaceOrderResponse r = sim.place_order(make_request(Side::Buy, 2.0, 100.0, "ETH/CAD"));
    ASSERT_EQ(r.commission, 0.0);
}

TEST(price_table) {
    PaperSimulator sim;
    sim.set_price("ETH/CAD", 3000.0);
    ASSERT_EQ(sim.get_price("ETH/CAD"), 3000.0);

    // Fills update the reference price
    sim.place_order(make_request(Side::Buy, 1.0, 3100.0, "ETH/CAD"));
    ASSERT_EQ(sim.get_price("ETH/CAD"), 3100.0);

    bool threw = false;
    try {
        sim.get_price("DOGE/CAD");
    } catch (const ValidationError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(malformed_requests_rejected_before_fill) {
    PaperSimulator sim;
    OrderRequest bad[] = {
        make_request(Side::Buy, 0.0, 100.0),
        make_request(Side::Buy, -1.0, 100.0),
        make_request(Side::Buy, 1.0, 0.0),
        make_request(Side::Buy, 1.0, NAN),
        make_request(Side::Buy, 1.0, 100.0, ""),
    };

    for (const auto& req : bad) {
        bool threw = false;
        try {
            sim.place_order(req);
        } catch (const ValidationError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    }
    ASSERT_EQ(sim.total_orders(), 0u);
    ASSERT_EQ(sim.next_order_id(), 1u);
}

TEST(cancel_has_nothing_resting) {
    PaperSimulator sim;
    OrderId id = sim.place_order(make_request(Side::Buy, 1.0, 10.0)).order_id;
    ASSERT_FALSE(sim.cancel_order(id));
    ASSERT_EQ(std::string(sim.name()), "paper");
}

int main() {
    std::cout << "\n=== PaperSimulator Tests ===\n\n";

    RUN_TEST(buy_fills_in_full_at_price);
    RUN_TEST(order_ids_start_at_one_and_increase);
    RUN_TEST(balances_settle_with_commission);
    RUN_TEST(zero_commission_rate);
    RUN_TEST(price_table);
    RUN_TEST(malformed_requests_rejected_before_fill);
    RUN_TEST(cancel_has_nothing_resting);

    std::cout << "\n=== All PaperSimulator Tests Passed! ===\n";
    return 0;
}
