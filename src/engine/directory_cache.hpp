#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "ignore.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    /**
     * @brief Everything the resolvers need to know about one source directory.
     *
     * Immutable once loaded. Load problems are kept as strings so that every
     * document beneath the directory reports the same error.
     */
    struct DirectoryInfo {
        std::filesystem::path dir; // Relative to the source root

        // data.json
        bool has_fragment = false;
        std::int64_t fragment_modified = 0;
        nlohmann::json data = nlohmann::json::object();
        nlohmann::json pages = nlohmann::json::object(); // Per-document override tables
        std::string error;

        // layout.tmpl and its layout.json options
        std::optional<std::filesystem::path> layout;
        std::int64_t layout_modified = 0;
        bool inherit = false;
        std::optional<std::filesystem::path> options_file;
        std::int64_t options_modified = 0;
        std::string layout_error;
        std::vector<std::string> layout_warnings;

        std::filesystem::path fragment_path() const;
    };

    /**
     * @brief Returns the directories from the source root ("") down to `dir`, inclusive.
     */
    std::vector<std::filesystem::path> ancestor_dirs(const std::filesystem::path& dir);

    /**
     * @brief Returns an error message if a user fragment sets a key the renderer owns.
     */
    std::optional<std::string> find_reserved_key(const nlohmann::json& fragment);

    /**
     * @brief Per-build-pass cache of DirectoryInfo, shared by DataResolver and LayoutResolver.
     *
     * The first caller for a directory loads it; concurrent callers for the
     * same directory wait for that load instead of reading the files again.
     * Fragments and layouts excluded by the ignore rules are not loaded.
     */
    class DirectoryCache {
    public:
        DirectoryCache(const Config& config, const std::filesystem::path& root, const Ignore& ignore);

        std::shared_ptr<const DirectoryInfo> get(const std::filesystem::path& dir);

        /**
         * @brief Number of directories actually read from disk.
         */
        size_t loads() const { return m_loads.load(); }

    private:
        using Slot = std::shared_future<std::shared_ptr<const DirectoryInfo>>;

        const Config& m_config;
        std::filesystem::path m_root;
        const Ignore& m_ignore;
        std::mutex m_mutex;
        std::map<std::string, Slot> m_slots;
        std::atomic<size_t> m_loads{0};

        std::shared_ptr<const DirectoryInfo> load(const std::filesystem::path& dir);
    };

}
