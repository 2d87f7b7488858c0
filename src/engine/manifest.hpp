#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    /**
     * @brief Persistent record of what was built for one output tag.
     *
     * Stored as JSON in <build>/<tag>.json. The manifest is read-only while
     * workers run; the builder records outcomes after all workers finished.
     */
    class BuildManifest {
    public:
        static constexpr int kVersion = 1;

        explicit BuildManifest(const Config& config);

        /**
         * @brief Loads the manifest file. A missing file yields an empty manifest.
         * @throws ManifestError if the file is unreadable, not a JSON object, or
         * carries a version that is not an integer.
         */
        void load();

        /**
         * @brief Writes the manifest atomically (temp file + rename).
         * @throws ManifestError if the file cannot be written.
         */
        void save() const;

        /**
         * @brief Checks whether a source needs to be processed again.
         *
         * A source is stale if it has no entry, its destination changed or is
         * missing, its modification time (or digest, in digest mode) differs,
         * any dependency changed, or, for documents, the partial templates
         * differ from the ones the entry was rendered with. Force and
         * non-incremental builds are always stale. Books are never kept fresh
         * by their digest, since it only covers book.toml.
         */
        bool is_stale(const SourceEntry& entry, const std::filesystem::path& destination,
                      const std::vector<Dependency>& dependencies) const;

        /**
         * @brief Builds the entry to record after a successful render or copy.
         */
        ManifestEntry make_entry(const SourceEntry& entry, const std::filesystem::path& destination,
                                 std::vector<Dependency> dependencies) const;

        void record(ManifestEntry entry);
        bool forget(const std::filesystem::path& source);

        /**
         * @brief Drops entries for sources that no longer exist.
         * @return The removed entries, so their outputs can be cleaned up.
         */
        std::vector<ManifestEntry> prune(const std::set<std::string>& live);

        const ManifestEntry* find(const std::filesystem::path& source) const;
        size_t size() const { return m_entries.size(); }

        /**
         * @brief Sets the signature of the partial templates used in this pass.
         * Document entries made afterwards carry it.
         */
        void set_partials(std::string signature) { m_partials = std::move(signature); }
        const std::string& partials() const { return m_partials; }

        const std::vector<std::string>& warnings() const { return m_warnings; }

        nlohmann::json to_json() const;

    private:
        const Config& m_config;
        std::filesystem::path m_file;
        std::map<std::string, ManifestEntry> m_entries; // Keyed by generic source path
        std::string m_partials;
        std::vector<std::string> m_warnings;

        bool read_entry(const std::string& key, const nlohmann::json& j);
    };

}
