#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <string>

#include "platform.hpp"
#include "engine/builder.hpp"
#include "engine/config.hpp"
#include "engine/errors.hpp"
#include "engine/reload.hpp"
#include "engine/reload_server.hpp"
#include "engine/scanner.hpp"
#include "engine/scheduler.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\n[Verso] Interrupt signal (" << signum << ") received. Shutting down...\n";
    g_running = false;
}

namespace {

    struct Options {
        std::string command = "build";
        std::filesystem::path config = "site.json";
        bool release = false;
        bool force = false;
        std::string tag;
    };

    void usage() {
        std::cerr << "Usage: verso [build|live] [--release] [--force] [--tag <name>] [--config <site.json>]\n";
    }

    bool parse_args(int argc, char* argv[], Options& opts) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "build" || arg == "live") {
                opts.command = arg;
            } else if (arg == "--release") {
                opts.release = true;
            } else if (arg == "--force") {
                opts.force = true;
            } else if (arg == "--tag" && i + 1 < argc) {
                opts.tag = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config = argv[++i];
            } else {
                std::cerr << "[Verso] Unknown argument: " << arg << "\n";
                return false;
            }
        }
        return true;
    }

    // Editor swap files and our own output must not trigger rebuilds
    bool is_relevant(const std::filesystem::path& path, const std::filesystem::path& build) {
        auto name = path.filename().string();
        if (name.empty() || name.back() == '~') return false;
        if (name.front() == '.' && name != verso::engine::kIgnoreFile) return false;
        std::error_code ec;
        auto canonical_build = std::filesystem::weakly_canonical(build, ec);
        auto canonical_path = std::filesystem::weakly_canonical(path, ec);
        auto rel = canonical_path.lexically_relative(canonical_build);
        return rel.empty() || rel.native().rfind("..", 0) == 0;
    }

    int run_live(verso::engine::Config& config) {
        verso::engine::ReloadCoordinator coordinator;
        verso::engine::Builder builder(config);

        auto first = builder.run();
        if (first.fatal) return first.exit_code();

        // Later passes are incremental
        config.force = false;

        verso::engine::ReloadServer server(config, coordinator);
        if (!server.start()) return 1;

        verso::engine::BuildScheduler scheduler([&]() {
            verso::engine::build_and_notify(builder, coordinator);
        }, std::chrono::milliseconds(config.live.debounce_ms));
        scheduler.start();

        auto sentry = verso::platform::Sentry::create();
        if (!sentry) return 1;

        sentry->set_callback([&](const verso::platform::FileEvent& event) {
            if (!is_relevant(event.path, config.build)) return;
            std::cout << "[Sentry] Change detected: " << event.path << "\n";
            scheduler.notify_change();
        });
        sentry->add_watch(config.source);

        std::thread sentry_thread([&sentry]() { sentry->start(); });
        std::cout << "[Verso] Ready.\n";

        while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Shutdown
        sentry->stop();
        if (sentry_thread.joinable()) sentry_thread.join();
        scheduler.stop();
        server.stop();
        return 0;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        usage();
        return 2;
    }

    verso::engine::Config config;
    try {
        config = verso::engine::Config::load(opts.config);
    } catch (const verso::engine::ConfigError& e) {
        std::cerr << "[Verso] " << e.path().string() << ": " << e.what() << "\n";
        return 1;
    }

    if (opts.release) config.set_release(true);
    if (!opts.tag.empty()) {
        if (opts.tag.find('/') != std::string::npos) {
            std::cerr << "[Verso] Invalid output tag '" << opts.tag << "'\n";
            return 2;
        }
        config.tag = opts.tag;
    }
    if (opts.force) config.force = true;
    if (opts.command == "live") config.live.enabled = true;

    std::cout << "[Verso] " << opts.command << " " << config.source << " -> " << config.target() << "\n";

    if (opts.command == "live") {
        return run_live(config);
    }

    verso::engine::Builder builder(config);
    return builder.run().exit_code();
}
