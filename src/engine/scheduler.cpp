#include "scheduler.hpp"
#include <iostream>
#include <stdexcept>

namespace verso::engine {

    BuildScheduler::BuildScheduler(Pass pass, std::chrono::milliseconds debounce)
        : m_pass(std::move(pass)), m_debounce(debounce) {}

    BuildScheduler::~BuildScheduler() {
        stop();
    }

    void BuildScheduler::notify_change() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending = true;
            m_last_change = Clock::now();
        }
        m_cv.notify_all();
    }

    void BuildScheduler::start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_thread.joinable()) return;
        m_stop = false;
        m_thread = std::thread(&BuildScheduler::run, this);
    }

    void BuildScheduler::stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_cv.notify_all();
        if (m_thread.joinable()) m_thread.join();
    }

    void BuildScheduler::wait_idle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return (!m_pending && !m_building) || m_stop; });
    }

    size_t BuildScheduler::passes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_passes;
    }

    void BuildScheduler::run() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true) {
            m_cv.wait(lock, [this] { return m_pending || m_stop; });
            if (m_stop) break;

            // Quiet period: restart the wait whenever another change lands
            while (!m_stop) {
                auto deadline = m_last_change + m_debounce;
                if (Clock::now() >= deadline) break;
                m_cv.wait_until(lock, deadline);
            }
            if (m_stop) break;

            m_pending = false;
            m_building = true;
            lock.unlock();

            try {
                m_pass();
            } catch (const std::exception& e) {
                std::cerr << "[Scheduler] Build pass failed: " << e.what() << "\n";
            }

            lock.lock();
            m_building = false;
            ++m_passes;
            m_cv.notify_all();
        }
        m_building = false;
        m_cv.notify_all();
    }

}
