#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace verso::engine {

    /**
     * @brief Turns a stream of change notifications into build passes.
     *
     * Changes are debounced: a pass starts once no change arrived for the
     * debounce interval. At most one pass runs at a time, and any number of
     * changes arriving during a pass cause exactly one follow-up pass.
     */
    class BuildScheduler {
    public:
        using Pass = std::function<void()>;

        BuildScheduler(Pass pass, std::chrono::milliseconds debounce);
        ~BuildScheduler();

        BuildScheduler(const BuildScheduler&) = delete;
        BuildScheduler& operator=(const BuildScheduler&) = delete;

        /**
         * @brief Records a change. Safe to call from any thread.
         */
        void notify_change();

        void start();
        void stop();

        /**
         * @brief Blocks until no pass is running or pending.
         */
        void wait_idle();

        size_t passes() const;

    private:
        using Clock = std::chrono::steady_clock;

        Pass m_pass;
        std::chrono::milliseconds m_debounce;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_pending = false;
        bool m_building = false;
        bool m_stop = false;
        size_t m_passes = 0;
        Clock::time_point m_last_change;
        std::thread m_thread;

        void run();
    };

}
