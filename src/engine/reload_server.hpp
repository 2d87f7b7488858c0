#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include "config.hpp"
#include "reload.hpp"

namespace httplib {
    class Server;
}

namespace verso::engine {

    /**
     * @brief HTTP server for live mode.
     *
     * Serves the destination tree as static files, the client script, and
     * the server-sent event stream fed by a ReloadCoordinator.
     */
    class ReloadServer {
    public:
        ReloadServer(const Config& config, ReloadCoordinator& coordinator);
        ~ReloadServer();

        ReloadServer(const ReloadServer&) = delete;
        ReloadServer& operator=(const ReloadServer&) = delete;

        /**
         * @brief Binds and starts listening on a background thread.
         * @return false if the address could not be bound.
         */
        bool start();
        void stop();

        bool running() const { return m_running; }

    private:
        const Config& m_config;
        ReloadCoordinator& m_coordinator;
        std::unique_ptr<httplib::Server> m_server;
        std::thread m_thread;
        std::atomic<bool> m_running{false};

        void setup_routes();
    };

}
