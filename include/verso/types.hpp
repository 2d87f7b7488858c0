#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace verso::engine {

    enum class SourceKind {
        Document,    // Renderable page (.md, .html)
        Template,    // Partial or layout template
        Data,        // Configuration fragment
        Book,        // File owned by a book subtree
        Passthrough, // Copied byte-for-byte
        Ignored
    };

    struct SourceEntry {
        std::filesystem::path path;     // Absolute
        std::filesystem::path relative; // Relative to the source root
        SourceKind kind = SourceKind::Passthrough;
        std::filesystem::file_time_type last_write_time;
    };

    struct BookProject {
        std::filesystem::path root;     // Relative to the source root ("" for the root itself)
        std::filesystem::path marker;   // Relative path of book.toml
    };

    /**
     * @brief A configuration file a rendered document depended on.
     */
    struct Dependency {
        std::filesystem::path path; // Relative to the source root
        std::int64_t modified = 0;

        bool operator==(const Dependency& other) const {
            return path == other.path && modified == other.modified;
        }
    };

    struct ManifestEntry {
        std::filesystem::path source;      // Relative to the source root
        std::int64_t modified = 0;         // Source mtime at the last successful render
        std::filesystem::path destination; // Relative to the destination root
        std::string digest;                // Only populated in digest mode
        std::string partials;              // Partial set signature, documents only
        std::vector<Dependency> dependencies;
    };

    const char* to_string(SourceKind kind);

    /**
     * @brief Converts a file time to a stable integer (nanoseconds since the clock epoch).
     */
    std::int64_t to_ticks(std::filesystem::file_time_type time);
    std::filesystem::file_time_type from_ticks(std::int64_t ticks);

}
