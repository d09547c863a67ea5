#pragma once

#include "../config/config.hpp"
#include "http_transport.hpp"
#include "platform_client.hpp"
#include "request_signer.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace riskgov {
namespace exchange {

/**
 * LiveClient - authenticated REST client for the NDAX exchange
 *
 * THIS CLIENT MOVES REAL MONEY. The Executor only routes to it in
 * LIVE_LIMITED mode.
 *
 * Endpoints (AlphaPoint /AP API):
 * - GET  /AP/GetAccountPositions  balances
 * - GET  /AP/GetLevel1            last traded price
 * - POST /AP/SendOrder            limit order, GTC
 * - GET  /AP/GetOrderStatus       fill confirmation after SendOrder
 * - POST /AP/CancelOrder
 *
 * place_order polls GetOrderStatus up to StatusPolling::max_polls times.
 * An order still working after the last poll is cancelled: a partial fill
 * is returned as Filled with the executed quantity, otherwise UnfilledError
 * is thrown. If polling itself fails, the order is cancelled before the
 * error propagates with the exchange order id attached.
 *
 * Every transport call runs under the shared RetryPolicy. Input is validated
 * before any request is built. HTTP 429/5xx map to NetworkError, other
 * non-200 statuses to RejectedError, undecodable bodies to ParseError.
 */
struct LiveStatusPolling {
    uint32_t max_polls = config::execution::FILL_POLL_ATTEMPTS;
    std::chrono::milliseconds interval{config::execution::FILL_POLL_INTERVAL_MS};
};

class LiveClient : public PlatformClient {
public:
    using StatusPolling = LiveStatusPolling;

    /**
     * @param sleeper waits between status polls (tests pass a no-op)
     * @throws ConfigError if credentials are incomplete
     */
    LiveClient(const LiveCredentials& credentials, std::unique_ptr<HttpTransport> transport, RetryPolicy retry,
               StatusPolling polling = StatusPolling{},
               RetryPolicy::Sleeper sleeper = RetryPolicy::default_sleeper());

    Balances get_balance() override;
    double get_price(const Symbol& symbol) override;
    PlaceOrderResponse place_order(const OrderRequest& request) override;
    bool cancel_order(OrderId order_id) override;
    const char* name() const override { return "ndax-live"; }

    /**
     * Map "BTC/CAD" style pair to NDAX instrument id.
     * @return 0 if the pair is not listed
     */
    static int instrument_id(const Symbol& symbol);

    RetryPolicy& retry_policy() { return retry_; }
    const StatusPolling& status_polling() const { return polling_; }

private:
    HttpHeaders auth_headers();
    std::string next_nonce();
    std::string endpoint(const char* path) const;

    PlaceOrderResponse await_fill(OrderId order_id);
    std::string cancel_after_failure(OrderId order_id);

    HttpResponse get(const std::string& url, const char* what);
    HttpResponse post(const std::string& url, const std::string& body, const char* what);

    LiveCredentials credentials_;
    std::unique_ptr<HttpTransport> transport_;
    RetryPolicy retry_;
    StatusPolling polling_;
    RetryPolicy::Sleeper sleeper_;
    RequestSigner signer_;
    int64_t account_number_;
    uint64_t last_nonce_;
};

} // namespace exchange
} // namespace riskgov
