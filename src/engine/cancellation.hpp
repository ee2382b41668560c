#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace ragmill::engine {

    /**
     * @brief Caller-owned stop flag with an optional deadline. Copies share the flag.
     * A default-constructed token never fires.
     */
    class CancellationToken {
    public:
        using Clock = std::chrono::steady_clock;

        CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

        static CancellationToken with_timeout(Clock::duration timeout) {
            CancellationToken token;
            token.m_deadline = Clock::now() + timeout;
            return token;
        }

        void cancel() const { m_flag->store(true); }

        bool cancelled() const {
            if (m_flag->load()) return true;
            return m_deadline && Clock::now() >= *m_deadline;
        }

    private:
        std::shared_ptr<std::atomic<bool>> m_flag;
        std::optional<Clock::time_point> m_deadline;
    };

}
