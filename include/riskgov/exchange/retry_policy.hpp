#pragma once

/**
 * RetryPolicy - the single retry rule for every PlatformClient call.
 *
 * Classification:
 * - NetworkError               -> retryable
 * - everything else            -> terminal, rethrown on first occurrence
 *
 * Backoff: base_delay * 2^(attempt-1), capped at max_delay.
 * After max_attempts, or when the abort predicate fires between attempts,
 * the last NetworkError is rethrown.
 */

#include "../errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <utility>

namespace riskgov {
namespace exchange {

class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using AbortPredicate = std::function<bool()>;
    using RetryCallback = std::function<void(uint32_t attempt, const NetworkError& error)>;

    struct Settings {
        uint32_t max_attempts = 3;
        std::chrono::milliseconds base_delay{200};
        std::chrono::milliseconds max_delay{2000};
    };

    RetryPolicy() : RetryPolicy(Settings{}) {}

    explicit RetryPolicy(const Settings& settings, Sleeper sleeper = default_sleeper())
        : settings_(settings)
        , sleeper_(std::move(sleeper)) {
        if (settings_.max_attempts == 0)
            settings_.max_attempts = 1;
    }

    // Checked before every attempt after the first
    void set_abort_predicate(AbortPredicate pred) { should_abort_ = std::move(pred); }

    // Notified after each failed attempt that will be retried
    void set_retry_callback(RetryCallback cb) { on_retry_ = std::move(cb); }

    /**
     * Delay before attempt (attempt+1), given attempt failed. attempt is 1-based.
     */
    std::chrono::milliseconds backoff(uint32_t attempt) const {
        auto delay = settings_.base_delay;
        for (uint32_t i = 1; i < attempt && delay < settings_.max_delay; ++i) {
            delay *= 2;
        }
        return std::min(delay, settings_.max_delay);
    }

    /**
     * Run op under the policy.
     * @return op's result from the first successful attempt
     */
    template <typename Op>
    auto run(Op&& op) const -> decltype(op()) {
        for (uint32_t attempt = 1;; ++attempt) {
            try {
                return op();
            } catch (const NetworkError& e) {
                if (attempt >= settings_.max_attempts)
                    throw;
                if (on_retry_)
                    on_retry_(attempt, e);
                sleeper_(backoff(attempt));
                if (should_abort_ && should_abort_())
                    throw;
            }
        }
    }

    const Settings& settings() const { return settings_; }

    static Sleeper default_sleeper() {
        return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

private:
    Settings settings_;
    Sleeper sleeper_;
    AbortPredicate should_abort_;
    RetryCallback on_retry_;
};

} // namespace exchange
} // namespace riskgov
