#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "ignore.hpp"
#include "config.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    inline constexpr const char* kIgnoreFile = ".versoignore";
    inline constexpr const char* kBookMarker = "book.toml";

    struct ScanResult {
        std::vector<SourceEntry> entries; // Sorted by relative path, not yet classified
        std::vector<BookProject> books;
    };

    class Scanner {
    public:
        explicit Scanner(const Config& config);

        /**
         * @brief Scans the source tree recursively.
         *
         * Ignored directories are pruned, .versoignore files are loaded on the
         * way down and book subtrees are recorded but not descended into.
         * @throws FatalError if the root is missing or unreadable.
         */
        ScanResult scan(const std::filesystem::path& root);

        const Ignore& ignore() const { return m_ignore; }

    private:
        const Config& m_config;
        Ignore m_ignore;
    };

}
