#include "../../include/riskgov/exchange/live_client.hpp"
#include "../../include/riskgov/errors.hpp"
#include "../../include/riskgov/util/time_utils.hpp"

#include <cmath>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace riskgov::exchange {

using json = nlohmann::json;

namespace {

// NDAX instrument ids (OMS 1)
const std::map<std::string, int>& instruments() {
    static const std::map<std::string, int> table = {
        {"BTC/CAD", 1}, {"ETH/CAD", 2}, {"USDT/CAD", 3}, {"XRP/CAD", 5},
        {"LTC/CAD", 6}, {"BTC/USD", 7}, {"ETH/USD", 8},
    };
    return table;
}

// NDAX side / order type / time-in-force codes
constexpr int NDAX_SIDE_BUY = 0;
constexpr int NDAX_SIDE_SELL = 1;
constexpr int NDAX_ORDER_TYPE_LIMIT = 2;
constexpr int NDAX_TIF_GTC = 1;

void check_status(const HttpResponse& response, const char* what) {
    if (response.status == 200)
        return;
    std::string detail = std::string(what) + " HTTP " + std::to_string(response.status) + ": " + response.body;
    if (response.status == 429 || response.status >= 500) {
        throw NetworkError(detail);
    }
    throw RejectedError(detail);
}

json parse_body(const HttpResponse& response, const char* what) {
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string(what) + ": " + e.what());
    }
}

double number_field(const json& obj, const char* key, const char* what) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ParseError(std::string(what) + ": missing " + key);
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::logic_error&) {
            throw ParseError(std::string(what) + ": " + key + " is not numeric");
        }
    }
    throw ParseError(std::string(what) + ": " + key + " has wrong type");
}

// Exchange order ids are positive integers. Fractions, negatives, NaN and 0
// are undecodable rather than truncated.
OrderId order_id_field(const json& obj, const char* what) {
    auto it = obj.find("OrderId");
    if (it == obj.end()) {
        throw ParseError(std::string(what) + ": missing OrderId");
    }
    OrderId id = INVALID_ORDER_ID;
    if (it->is_number_unsigned()) {
        id = it->get<OrderId>();
    } else if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        if (value > 0)
            id = static_cast<OrderId>(value);
    } else if (it->is_number_float()) {
        double value = it->get<double>();
        if (std::isfinite(value) && value >= 1.0 && value < 1.8e19 && std::floor(value) == value)
            id = static_cast<OrderId>(value);
    } else if (it->is_string()) {
        const std::string text = it->get<std::string>();
        if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
            try {
                id = std::stoull(text);
            } catch (const std::logic_error&) {
                id = INVALID_ORDER_ID;
            }
        }
    }
    if (id == INVALID_ORDER_ID) {
        throw ParseError(std::string(what) + ": invalid OrderId " + it->dump());
    }
    return id;
}

// A fill with a non-positive or non-finite quantity or price cannot be
// accounted.
void fill_fields(const json& status, OrderId order_id, double& quantity, double& price) {
    try {
        quantity = number_field(status, "QuantityExecuted", "GetOrderStatus");
        price = number_field(status, "AvgPrice", "GetOrderStatus");
    } catch (ParseError& e) {
        e.set_order_id(order_id);
        throw;
    }
    if (!std::isfinite(quantity) || quantity <= 0.0 || !std::isfinite(price) || price <= 0.0) {
        throw ParseError("GetOrderStatus: order " + std::to_string(order_id) + " executed with QuantityExecuted " +
                             std::to_string(quantity) + " at AvgPrice " + std::to_string(price),
                         order_id);
    }
}

} // namespace

LiveClient::LiveClient(const LiveCredentials& credentials, std::unique_ptr<HttpTransport> transport,
                       RetryPolicy retry, StatusPolling polling, RetryPolicy::Sleeper sleeper)
    : credentials_(credentials)
    , transport_(std::move(transport))
    , retry_(std::move(retry))
    , polling_(polling)
    , sleeper_(std::move(sleeper))
    , signer_(credentials.api_key, credentials.api_secret, credentials.user_id)
    , account_number_(0)
    , last_nonce_(0) {
    if (!credentials_.complete()) {
        throw ConfigError("live trading requires NDAX_API_KEY, NDAX_API_SECRET, NDAX_USER_ID and NDAX_ACCOUNT_ID");
    }
    try {
        size_t used = 0;
        account_number_ = std::stoll(credentials_.account_id, &used);
        if (used != credentials_.account_id.size())
            throw ConfigError("NDAX_ACCOUNT_ID must be numeric");
    } catch (const std::logic_error&) {
        throw ConfigError("NDAX_ACCOUNT_ID must be numeric");
    }
    if (!transport_) {
        throw ConfigError("live client requires an HTTP transport");
    }
    if (polling_.max_polls == 0) {
        polling_.max_polls = 1;
    }
}

int LiveClient::instrument_id(const Symbol& symbol) {
    auto it = instruments().find(symbol);
    return it == instruments().end() ? 0 : it->second;
}

// =============================================================================
// PlatformClient
// =============================================================================

Balances LiveClient::get_balance() {
    std::string url = endpoint("/AP/GetAccountPositions") + "?OMSId=" + std::to_string(config::live::OMS_ID) +
                      "&AccountId=" + credentials_.account_id;

    HttpResponse response = get(url, "GetAccountPositions");
    json data = parse_body(response, "GetAccountPositions");

    if (!data.is_array()) {
        throw ParseError("GetAccountPositions: expected array");
    }

    Balances balances;
    for (const auto& entry : data) {
        if (!entry.is_object() || !entry.contains("ProductSymbol") || !entry["ProductSymbol"].is_string()) {
            throw ParseError("GetAccountPositions: malformed position entry");
        }
        balances[entry["ProductSymbol"].get<std::string>()] = number_field(entry, "Amount", "GetAccountPositions");
    }
    return balances;
}

double LiveClient::get_price(const Symbol& symbol) {
    int instrument = instrument_id(symbol);
    if (instrument == 0) {
        throw ValidationError("unknown trading pair " + symbol);
    }

    std::string url = endpoint("/AP/GetLevel1") + "?OMSId=" + std::to_string(config::live::OMS_ID) +
                      "&InstrumentId=" + std::to_string(instrument);

    HttpResponse response = get(url, "GetLevel1");
    json data = parse_body(response, "GetLevel1");

    if (!data.is_object()) {
        throw ParseError("GetLevel1: expected object");
    }
    double price = number_field(data, "LastTradedPx", "GetLevel1");
    if (price <= 0.0) {
        throw ParseError("GetLevel1: non-positive LastTradedPx");
    }
    return price;
}

PlaceOrderResponse LiveClient::place_order(const OrderRequest& request) {
    // Validate before any network call
    validate_order_request(request);
    int instrument = instrument_id(request.symbol);
    if (instrument == 0) {
        throw ValidationError("unknown trading pair " + request.symbol);
    }

    json payload = {
        {"InstrumentId", instrument},
        {"OMSId", config::live::OMS_ID},
        {"AccountId", account_number_},
        {"TimeInForce", NDAX_TIF_GTC},
        {"ClientOrderId", 0},
        {"OrderIdOCO", 0},
        {"UseDisplayQuantity", false},
        {"Side", request.side == Side::Buy ? NDAX_SIDE_BUY : NDAX_SIDE_SELL},
        {"Quantity", request.quantity},
        {"OrderType", NDAX_ORDER_TYPE_LIMIT},
        {"PegPriceType", "1"},
        {"LimitPrice", request.price},
    };

    HttpResponse response = post(endpoint("/AP/SendOrder"), payload.dump(), "SendOrder");
    json data = parse_body(response, "SendOrder");

    if (!data.is_object() || !data.contains("status") || !data["status"].is_string()) {
        throw ParseError("SendOrder: missing status");
    }
    if (data["status"].get<std::string>() != "Accepted") {
        std::string msg = data.contains("errormsg") && data["errormsg"].is_string()
                              ? data["errormsg"].get<std::string>()
                              : data["status"].get<std::string>();
        throw RejectedError("SendOrder: " + msg);
    }

    OrderId order_id = order_id_field(data, "SendOrder");

    // From here on the order rests on the book. Any failure must cancel it
    // before it is reported.
    try {
        return await_fill(order_id);
    } catch (NetworkError& e) {
        std::string note = cancel_after_failure(order_id);
        e.set_order_id(order_id);
        if (note.empty())
            throw;
        throw NetworkError("order " + std::to_string(order_id) + " status unknown (" + e.what() + "); " + note, order_id);
    } catch (ParseError& e) {
        std::string note = cancel_after_failure(order_id);
        e.set_order_id(order_id);
        if (note.empty())
            throw;
        throw ParseError("order " + std::to_string(order_id) + " status unknown (" + e.what() + "); " + note, order_id);
    }
}

PlaceOrderResponse LiveClient::await_fill(OrderId order_id) {
    std::string status_url = endpoint("/AP/GetOrderStatus") + "?OMSId=" + std::to_string(config::live::OMS_ID) +
                             "&AccountId=" + credentials_.account_id + "&OrderId=" + std::to_string(order_id);

    PlaceOrderResponse result;
    result.order_id = order_id;
    json status;

    for (uint32_t poll = 1;; ++poll) {
        HttpResponse status_response = get(status_url, "GetOrderStatus");
        status = parse_body(status_response, "GetOrderStatus");

        if (!status.is_object() || !status.contains("OrderState") || !status["OrderState"].is_string()) {
            throw ParseError("GetOrderStatus: missing OrderState");
        }

        const std::string state = status["OrderState"].get<std::string>();
        if (state == "FullyExecuted") {
            fill_fields(status, order_id, result.filled_quantity, result.filled_price);
            result.status = OrderStatus::Filled;
            return result;
        }
        if (state == "Rejected" || state == "Canceled" || state == "Expired") {
            throw RejectedError("GetOrderStatus: order " + std::to_string(order_id) + " " + state, order_id);
        }
        if (poll >= polling_.max_polls)
            break;
        sleeper_(polling_.interval);
    }

    // Deadline passed with the order still working
    std::string note = cancel_after_failure(order_id);

    auto executed = status.find("QuantityExecuted");
    bool partial = executed != status.end() && !executed->is_null() &&
                   number_field(status, "QuantityExecuted", "GetOrderStatus") > 0.0;
    if (partial) {
        // The executed part stays with the account and must be accounted
        fill_fields(status, order_id, result.filled_quantity, result.filled_price);
        result.status = OrderStatus::Filled;
        result.error = note.empty() ? "partially filled, remainder cancelled" : "partially filled; " + note;
        return result;
    }

    std::string msg = "order " + std::to_string(order_id) + " not filled after " +
                      std::to_string(polling_.max_polls) + " status polls";
    throw UnfilledError(note.empty() ? msg + ", cancelled" : msg + "; " + note, order_id);
}

// Returns an empty string when the cancel was confirmed, otherwise a note
// for the caller's error message.
std::string LiveClient::cancel_after_failure(OrderId order_id) {
    try {
        if (cancel_order(order_id))
            return "";
        return "cancel of order " + std::to_string(order_id) + " not confirmed";
    } catch (const PlatformError& e) {
        return "cancel of order " + std::to_string(order_id) + " failed: " + e.what();
    }
}

bool LiveClient::cancel_order(OrderId order_id) {
    json payload = {
        {"OMSId", config::live::OMS_ID},
        {"AccountId", account_number_},
        {"OrderId", order_id},
    };

    HttpResponse response = post(endpoint("/AP/CancelOrder"), payload.dump(), "CancelOrder");
    json data = parse_body(response, "CancelOrder");

    if (!data.is_object() || !data.contains("result") || !data["result"].is_boolean()) {
        throw ParseError("CancelOrder: missing result");
    }
    return data["result"].get<bool>();
}

// =============================================================================
// Transport helpers
// =============================================================================

std::string LiveClient::endpoint(const char* path) const {
    return credentials_.base_url + path;
}

std::string LiveClient::next_nonce() {
    // Strictly increasing even when called twice in the same millisecond
    uint64_t nonce = util::wall_clock_ms();
    if (nonce <= last_nonce_) {
        nonce = last_nonce_ + 1;
    }
    last_nonce_ = nonce;
    return std::to_string(nonce);
}

HttpHeaders LiveClient::auth_headers() {
    std::string nonce = next_nonce();
    return HttpHeaders{
        {"APIKey", signer_.api_key()},
        {"Nonce", nonce},
        {"UserId", signer_.user_id()},
        {"Signature", signer_.sign(nonce)},
        {"Content-Type", "application/json"},
    };
}

// Status is checked inside the retried operation so 429/5xx are retried too
HttpResponse LiveClient::get(const std::string& url, const char* what) {
    return retry_.run([&]() {
        HttpResponse response = transport_->get(url, auth_headers());
        check_status(response, what);
        return response;
    });
}

HttpResponse LiveClient::post(const std::string& url, const std::string& body, const char* what) {
    return retry_.run([&]() {
        HttpResponse response = transport_->post(url, auth_headers(), body);
        check_status(response, what);
        return response;
    });
}

} // namespace riskgov::exchange
