#include "reload_server.hpp"
#include <httplib.h>
#include <chrono>
#include <iostream>

namespace verso::engine {

    namespace {

        constexpr auto kKeepAlive = std::chrono::seconds(15);
        constexpr int kRetryMs = 1000;

        // Unnamed events so the browser's onmessage handler sees them
        void write_sse_event(httplib::DataSink& sink, const std::string& payload) {
            std::string block;
            block.reserve(payload.size() + 16);
            block.append("data: ");
            block.append(payload);
            block.append("\n\n");
            sink.write(block.data(), block.size());
        }

        void write_sse_comment(httplib::DataSink& sink, const std::string& comment) {
            std::string block = ": " + comment + "\n\n";
            sink.write(block.data(), block.size());
        }

        void write_sse_retry(httplib::DataSink& sink, int milliseconds) {
            std::string block = "retry: " + std::to_string(milliseconds) + "\n\n";
            sink.write(block.data(), block.size());
        }

    }

    ReloadServer::ReloadServer(const Config& config, ReloadCoordinator& coordinator)
        : m_config(config), m_coordinator(coordinator), m_server(std::make_unique<httplib::Server>()) {
        setup_routes();
    }

    ReloadServer::~ReloadServer() {
        stop();
    }

    void ReloadServer::setup_routes() {
        m_server->Get(kEventsPath, [this](const httplib::Request&, httplib::Response& res) {
            auto channel = m_coordinator.subscribe();
            std::cout << "[Reload] Client connected (" << m_coordinator.client_count() << " total)\n";

            res.set_header("Cache-Control", "no-cache");
            res.set_chunked_content_provider(
                "text/event-stream",
                [channel, started = false](size_t, httplib::DataSink& sink) mutable {
                    if (!started) {
                        started = true;
                        write_sse_retry(sink, kRetryMs);
                        return true;
                    }
                    ReloadEvent event;
                    if (channel->pop_for(event, kKeepAlive)) {
                        write_sse_event(sink, event.to_json().dump());
                    } else if (channel->stopped()) {
                        sink.done();
                        return false;
                    } else {
                        write_sse_comment(sink, "keepalive");
                    }
                    return sink.is_writable();
                },
                [this, channel](bool) {
                    m_coordinator.unsubscribe(channel);
                });
        });

        m_server->Get(kScriptPath, [](const httplib::Request&, httplib::Response& res) {
            res.set_content(livereload_script(), "application/javascript");
        });

        if (!m_server->set_mount_point("/", m_config.target().string())) {
            std::cerr << "[Reload] Cannot serve " << m_config.target() << ": not a directory\n";
        }
    }

    bool ReloadServer::start() {
        if (!m_server->bind_to_port(m_config.live.host, m_config.live.port)) {
            std::cerr << "[Reload] Failed to bind " << m_config.live.host << ":" << m_config.live.port << "\n";
            return false;
        }
        m_running = true;
        m_thread = std::thread([this] {
            std::cout << "[Reload] Serving http://" << m_config.live.host << ":" << m_config.live.port << "/\n";
            m_server->listen_after_bind();
            m_running = false;
        });
        return true;
    }

    void ReloadServer::stop() {
        m_coordinator.close_all();
        if (m_server) m_server->stop();
        if (m_thread.joinable()) m_thread.join();
    }

}
