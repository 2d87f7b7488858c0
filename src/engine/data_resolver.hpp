#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "classifier.hpp"
#include "config.hpp"
#include "directory_cache.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    struct ResolvedContext {
        SourceEntry document;
        nlohmann::json data = nlohmann::json::object();
        std::string title;
        bool standalone = false;
        bool draft = false;
        std::optional<bool> clean;                    // Per-document clean URL override
        std::optional<std::filesystem::path> layout;  // Explicit layout, relative to the source root
        std::filesystem::path destination;            // Relative to the destination root
        std::optional<std::string> body;              // Document text without front matter
        std::vector<std::string> warnings;
        std::vector<Dependency> dependencies;         // Fragments this context was merged from
    };

    /**
     * @brief Merges `overlay` into `base` key by key. Overlay values replace base values;
     * nested tables are replaced whole.
     */
    void merge_data(nlohmann::json& base, const nlohmann::json& overlay);

    /**
     * @brief "getting-started_guide" -> "Getting Started Guide".
     */
    std::string humanize(const std::string& name);

    class DataResolver {
    public:
        DataResolver(const Config& config, DirectoryCache& cache, const Classifier& classifier);

        /**
         * @brief Resolves the merged data for one document.
         *
         * Order, later wins: site "page" table, data.json from the source root
         * down to the document's directory, matching "pages" tables, the
         * document's front matter, then its sidecar fragment.
         * @throws ConfigError for a malformed fragment or a reserved key.
         */
        ResolvedContext resolve(const SourceEntry& document) const;

    private:
        const Config& m_config;
        DirectoryCache& m_cache;
        const Classifier& m_classifier;

        void apply_pages(const DirectoryInfo& info, const std::filesystem::path& document,
                         nlohmann::json& data) const;
        std::string infer_title(const SourceEntry& document) const;
    };

}
