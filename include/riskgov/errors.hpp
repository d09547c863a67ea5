#pragma once

/**
 * Error taxonomy for platform and configuration seams.
 *
 * - ValidationError: malformed input, raised before any I/O. Never retried.
 * - NetworkError:    transport failure. Retried by RetryPolicy.
 * - ParseError:      response could not be decoded. Callers must treat the
 *                    value as unknown, not as zero.
 * - RejectedError:   counterparty explicitly declined. Never retried.
 * - UnfilledError:   order was accepted but did not fill before the status
 *                    deadline; a cancel has been requested.
 *
 * A platform error raised after the exchange accepted an order carries the
 * exchange order id (INVALID_ORDER_ID otherwise).
 *
 * Governor vetoes are not exceptions; see RiskDecision.
 */

#include "types.hpp"

#include <stdexcept>
#include <string>

namespace riskgov {

class PlatformError : public std::runtime_error {
public:
    explicit PlatformError(const std::string& what, OrderId order_id = INVALID_ORDER_ID)
        : std::runtime_error(what), order_id_(order_id) {}

    OrderId order_id() const { return order_id_; }
    void set_order_id(OrderId order_id) { order_id_ = order_id; }

private:
    OrderId order_id_;
};

class ValidationError : public PlatformError {
public:
    explicit ValidationError(const std::string& what) : PlatformError("validation: " + what) {}
};

class NetworkError : public PlatformError {
public:
    explicit NetworkError(const std::string& what, OrderId order_id = INVALID_ORDER_ID)
        : PlatformError("network: " + what, order_id) {}
};

class ParseError : public PlatformError {
public:
    explicit ParseError(const std::string& what, OrderId order_id = INVALID_ORDER_ID)
        : PlatformError("parse: " + what, order_id) {}
};

class RejectedError : public PlatformError {
public:
    explicit RejectedError(const std::string& what, OrderId order_id = INVALID_ORDER_ID)
        : PlatformError("rejected: " + what, order_id) {}
};

class UnfilledError : public PlatformError {
public:
    UnfilledError(const std::string& what, OrderId order_id) : PlatformError("unfilled: " + what, order_id) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error("config: " + what) {}
};

} // namespace riskgov
