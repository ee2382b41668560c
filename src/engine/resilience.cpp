#include "resilience.hpp"
#include "embedder.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>

namespace ragmill::engine {

    std::chrono::milliseconds RetryPolicy::backoff_for(size_t retry) const {
        double factor = std::pow(multiplier, static_cast<double>(retry > 0 ? retry - 1 : 0));
        double ms = static_cast<double>(initial_backoff.count()) * factor;
        ms = std::min(ms, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<long long>(ms));
    }

    CircuitBreaker::CircuitBreaker(size_t failure_threshold, std::chrono::milliseconds cooldown)
        : m_threshold(failure_threshold == 0 ? 1 : failure_threshold), m_cooldown(cooldown) {}

    bool CircuitBreaker::allow() {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (m_state) {
            case State::Closed:
                return true;
            case State::Open:
                if (std::chrono::steady_clock::now() - m_opened_at < m_cooldown) return false;
                m_state = State::HalfOpen;
                m_trial_in_flight = true;
                return true;
            case State::HalfOpen:
                if (m_trial_in_flight) return false;
                m_trial_in_flight = true;
                return true;
        }
        return false;
    }

    void CircuitBreaker::record_success() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures = 0;
        m_state = State::Closed;
        m_trial_in_flight = false;
    }

    void CircuitBreaker::record_failure() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_failures;
        m_trial_in_flight = false;
        if (m_state == State::HalfOpen || m_failures >= m_threshold) {
            m_state = State::Open;
            m_opened_at = std::chrono::steady_clock::now();
        }
    }

    CircuitBreaker::State CircuitBreaker::state() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    size_t CircuitBreaker::consecutive_failures() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failures;
    }

    namespace {

        // Sleeps in short slices so cancellation is noticed. Returns false if cancelled.
        bool sleep_for(std::chrono::milliseconds delay, const CancellationToken& cancel) {
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (cancel.cancelled()) return false;
                auto left = until - std::chrono::steady_clock::now();
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, std::chrono::milliseconds(20)));
            }
            return !cancel.cancelled();
        }

    }

    std::vector<float> embed_with_retry(Embedder& embedder, const std::string& text, const RetryPolicy& policy,
                                        CircuitBreaker& breaker, const CancellationToken& cancel) {
        size_t attempts = std::max<size_t>(policy.max_attempts, 1);
        std::string last_error;

        for (size_t attempt = 1; attempt <= attempts; ++attempt) {
            if (cancel.cancelled()) {
                throw EmbeddingError("embedding cancelled", false);
            }
            if (!breaker.allow()) {
                throw EmbeddingError("circuit breaker open for " + embedder.model_id() +
                                     " after " + std::to_string(breaker.consecutive_failures()) +
                                     " consecutive failures");
            }

            try {
                auto vector = embedder.embed(text);
                breaker.record_success();
                return vector;
            } catch (const EmbeddingError& e) {
                breaker.record_failure();
                if (!e.retryable()) throw;
                last_error = e.what();
            } catch (const std::exception&) {
                // Also releases a half-open trial slot.
                breaker.record_failure();
                throw;
            }

            if (attempt < attempts) {
                std::cerr << "[Embedder] Attempt " << attempt << "/" << attempts << " failed: " << last_error
                          << " (retrying)\n";
                if (!sleep_for(policy.backoff_for(attempt), cancel)) {
                    throw EmbeddingError("embedding cancelled", false);
                }
            }
        }
        throw EmbeddingError("giving up after " + std::to_string(attempts) + " attempts: " + last_error);
    }

}
