#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>

namespace ragmill::engine {

    /**
     * @brief Multi-producer, multi-consumer work queue.
     * After close(), pop() drains what is left and then returns false.
     */
    template <typename T>
    class JobQueue {
    public:
        void push(T item) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(item));
            }
            m_cv.notify_one();
        }

        bool pop(T& item) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_closed; });

            if (m_queue.empty()) return false;

            item = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_cv.notify_all();
        }

        /**
         * @brief Drops pending items; used when a run is cancelled.
         */
        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::queue<T>().swap(m_queue);
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_closed = false;
    };

}
