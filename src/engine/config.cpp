#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <set>
#include <thread>

namespace verso::engine {

    namespace {

        const std::set<std::string> kTopLevelKeys = {
            "source", "build", "tag", "release", "clean_url", "incremental", "force",
            "digest", "workers", "templates", "layout", "ignore", "page", "redirect", "book", "live"
        };

        template <typename T>
        void read(const nlohmann::json& j, const char* key, T& out) {
            if (j.contains(key)) out = j.at(key).get<T>();
        }

    }

    size_t Config::worker_count() const {
        if (workers > 0) return workers;
        size_t hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 2;
    }

    void Config::set_release(bool value) {
        bool default_tag = (tag == "debug" || tag == "release");
        release = value;
        if (default_tag) tag = value ? "release" : "debug";
    }

    Config Config::from_json(const nlohmann::json& j, const std::filesystem::path& base) {
        Config cfg;
        cfg.source = base / cfg.source;
        cfg.build = base / cfg.build;

        if (!j.is_object()) {
            throw ConfigError(base, "site configuration must be a JSON object");
        }

        try {
            std::string source, build;
            read(j, "source", source);
            read(j, "build", build);
            if (!source.empty()) cfg.source = base / source;
            if (!build.empty()) cfg.build = base / build;

            read(j, "release", cfg.release);
            cfg.tag = cfg.release ? "release" : "debug";
            read(j, "tag", cfg.tag);
            read(j, "clean_url", cfg.clean_url);
            read(j, "incremental", cfg.incremental);
            read(j, "force", cfg.force);
            read(j, "digest", cfg.digest);
            read(j, "workers", cfg.workers);
            read(j, "templates", cfg.templates);
            read(j, "layout", cfg.layout);
            read(j, "ignore", cfg.ignore);

            if (j.contains("page")) {
                if (!j["page"].is_object()) {
                    throw ConfigError(base, "'page' must be a table");
                }
                cfg.page = j["page"];
            }

            if (j.contains("redirect")) {
                if (!j["redirect"].is_object()) {
                    throw ConfigError(base, "'redirect' must be a table of URL to location");
                }
                read(j, "redirect", cfg.redirect);
            }

            if (j.contains("book")) {
                const auto& book = j["book"];
                read(book, "command", cfg.book.command);
                std::string theme;
                read(book, "theme", theme);
                cfg.book.theme = theme;
            }

            if (j.contains("live")) {
                const auto& live = j["live"];
                read(live, "enabled", cfg.live.enabled);
                read(live, "host", cfg.live.host);
                read(live, "port", cfg.live.port);
                read(live, "debounce_ms", cfg.live.debounce_ms);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(base, std::string("invalid site configuration: ") + e.what());
        }

        if (cfg.tag.empty() || cfg.tag.find('/') != std::string::npos) {
            throw ConfigError(base, "invalid output tag '" + cfg.tag + "'");
        }

        for (const auto& item : j.items()) {
            if (kTopLevelKeys.count(item.key()) == 0) {
                cfg.warnings.push_back("unknown configuration key '" + item.key() + "'");
            }
        }
        return cfg;
    }

    Config Config::load(const std::filesystem::path& path) {
        auto base = path.parent_path();
        if (!std::filesystem::exists(path)) {
            return from_json(nlohmann::json::object(), base);
        }

        std::ifstream f(path);
        if (!f) {
            throw ConfigError(path, "cannot read site configuration");
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(f);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(path, std::string("malformed site configuration: ") + e.what());
        }
        return from_json(j, base);
    }

}
