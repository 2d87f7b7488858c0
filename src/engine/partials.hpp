#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "config.hpp"

namespace verso::engine {

    /**
     * @brief The named partial templates of one build pass.
     *
     * Every template below the templates directory is registered under its
     * path relative to that directory, with and without extension
     * ("nav.html" and "nav"). Loaded once per pass and shared read-only by
     * the per-worker renderers.
     */
    class PartialSet {
    public:
        PartialSet() = default;

        /**
         * @brief Reads all templates below `dir`. A missing directory yields an empty set.
         * @throws std::ios_base::failure if a template cannot be read.
         */
        static PartialSet load(const std::filesystem::path& dir);

        void add(const std::string& name, std::string content);

        const std::map<std::string, std::string>& templates() const { return m_templates; }
        bool empty() const { return m_templates.empty(); }

        /**
         * @brief SHA-256 over names and contents. Changes whenever any partial changes.
         */
        std::string signature() const;

    private:
        std::map<std::string, std::string> m_templates; // Keyed by registered name
    };

}
