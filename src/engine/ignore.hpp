#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace verso::engine {

    /**
     * @brief Ignore rules for the source tree.
     *
     * Names starting with a dot are ignored unless a negated pattern
     * ("!name") force-includes them. Patterns are evaluated in the order they
     * were added and the last match wins, so patterns from deeper
     * .versoignore files override those of their ancestors.
     */
    class Ignore {
    public:
        /**
         * @brief Loads patterns from an ignore file.
         * @param ignore_file Path to the ignore file.
         * @param base Directory (relative to the source root) the patterns apply to.
         */
        void load(const std::filesystem::path& ignore_file, const std::filesystem::path& base = {});

        /**
         * @brief Adds a single pattern scoped to a base directory.
         */
        void add(const std::string& pattern, const std::filesystem::path& base = {});

        /**
         * @brief Adds the default set of ignores (VCS folders, editor droppings).
         */
        void add_defaults();

        /**
         * @brief Checks a single path, assuming its parents are not ignored.
         * @param relative Path relative to the source root.
         * @param is_dir Whether the path names a directory.
         */
        bool check(const std::filesystem::path& relative, bool is_dir = false) const;

        /**
         * @brief Checks a path and every parent directory of it.
         */
        bool excludes(const std::filesystem::path& relative) const;

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
            std::filesystem::path base;
            bool negated = false;
            bool dir_only = false;
            bool anchored = false;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
