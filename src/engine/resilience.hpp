#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include "cancellation.hpp"

namespace ragmill::engine {

    class Embedder;

    struct RetryPolicy {
        size_t max_attempts = 3;
        std::chrono::milliseconds initial_backoff{200};
        std::chrono::milliseconds max_backoff{5000};
        double multiplier = 2.0;

        /**
         * @brief Delay before the given retry (1-based), capped at max_backoff.
         */
        std::chrono::milliseconds backoff_for(size_t retry) const;
    };

    /**
     * @brief Stops calling a failing dependency after too many consecutive failures.
     *
     * Closed: calls pass. After `failure_threshold` consecutive failures the breaker opens
     * and rejects calls until `cooldown` has elapsed; then one trial call is let through
     * (half-open). A success closes it again, a failure re-opens it.
     */
    class CircuitBreaker {
    public:
        enum class State { Closed, Open, HalfOpen };

        CircuitBreaker(size_t failure_threshold = 5, std::chrono::milliseconds cooldown = std::chrono::seconds(30));

        bool allow();
        void record_success();
        void record_failure();

        State state() const;
        size_t consecutive_failures() const;

    private:
        mutable std::mutex m_mutex;
        size_t m_threshold;
        std::chrono::milliseconds m_cooldown;
        size_t m_failures = 0;
        State m_state = State::Closed;
        std::chrono::steady_clock::time_point m_opened_at{};
        bool m_trial_in_flight = false;
    };

    /**
     * @brief Calls embedder.embed() with backoff between retryable failures.
     *
     * Non-retryable errors are rethrown at once. An open breaker fails fast. Backoff sleeps
     * wake up early when the token is cancelled.
     * @throws EmbeddingError once attempts are exhausted, the breaker is open, or on cancellation.
     */
    std::vector<float> embed_with_retry(Embedder& embedder, const std::string& text, const RetryPolicy& policy,
                                        CircuitBreaker& breaker, const CancellationToken& cancel);

}
