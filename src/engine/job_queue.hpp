#pragma once

#include <queue>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include <atomic>

namespace verso::engine {

    /**
     * @brief Blocking multi-producer multi-consumer queue.
     *
     * Feeds documents to the build workers and events to live reload clients.
     * After stop(), consumers drain what is left and then get false.
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
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            item = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        /**
         * @brief Like pop(), but gives up after `timeout`. Returns false on timeout or when stopped and empty.
         */
        template <typename Rep, typename Period>
        bool pop_for(T& item, std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_stop; })) return false;

            if (m_queue.empty()) return false;

            item = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        bool stopped() const { return m_stop; }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::atomic<bool> m_stop{false};
    };

}
