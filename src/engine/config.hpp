#pragma once

#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace verso::engine {

    struct Config {
        struct Book {
            std::string command = "mdbook";
            std::filesystem::path theme; // Relative to the source root, empty = none
        };

        struct Live {
            bool enabled = false;
            std::string host = "localhost";
            int port = 8080;
            int debounce_ms = 100;
        };

        std::filesystem::path source = "site";
        std::filesystem::path build = "build";
        std::string tag = "debug";
        bool release = false;
        bool clean_url = true;
        bool incremental = true;
        bool force = false;
        bool digest = false;            // Guard mtime checks with a SHA-256 of the source
        size_t workers = 0;             // 0 = hardware concurrency
        std::string templates = "templates";
        std::string layout = "layout.tmpl";
        std::vector<std::string> ignore;
        nlohmann::json page = nlohmann::json::object(); // Global page data
        std::map<std::string, std::string> redirect;    // Site URL -> location
        Book book;
        Live live;

        // Non-fatal problems found while loading (unknown keys)
        std::vector<std::string> warnings;

        std::filesystem::path target() const { return build / tag; }
        std::filesystem::path manifest_file() const { return build / (tag + ".json"); }
        std::filesystem::path templates_dir() const { return source / templates; }
        size_t worker_count() const;

        /**
         * @brief Switches between debug and release output, keeping a custom tag.
         */
        void set_release(bool value);

        /**
         * @brief Loads a site.json file. Relative paths resolve against its directory.
         * @return Defaults rooted at the file's directory if the file does not exist.
         * @throws ConfigError if the file is malformed or a value has the wrong type.
         */
        static Config load(const std::filesystem::path& path);

        /**
         * @brief Builds a config from an already parsed document.
         * @param base Directory that relative paths are resolved against.
         */
        static Config from_json(const nlohmann::json& j, const std::filesystem::path& base);
    };

}
