#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "ignore.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    inline constexpr const char* kIndexStem = "index";
    inline constexpr const char* kDataFile = "data.json";
    inline constexpr const char* kDataExtension = ".json";

    // Precedence order: a sidecar shared by twins belongs to the first
    inline const std::vector<std::string> kDocumentExtensions = {".md", ".html"};
    inline const std::vector<std::string> kTemplateExtensions = {".tmpl", ".html", ".json"};

    bool is_index(const std::filesystem::path& relative);
    bool has_document_extension(const std::filesystem::path& relative);

    /**
     * @brief The set of scanned relative paths, used for sibling lookups
     * without touching the filesystem.
     */
    class SourceTree {
    public:
        SourceTree() = default;
        explicit SourceTree(const std::vector<SourceEntry>& entries);

        void add(const std::filesystem::path& relative);
        bool contains(const std::filesystem::path& relative) const;

        /**
         * @brief Returns the first document sibling with the given stem, in extension precedence order.
         */
        std::optional<std::filesystem::path> document_with_stem(const std::filesystem::path& dir,
                                                                const std::string& stem) const;

    private:
        std::set<std::string> m_paths; // Generic form
    };

    class Classifier {
    public:
        struct Result {
            SourceKind kind = SourceKind::Passthrough;
            std::vector<std::string> warnings;
        };

        Classifier(const Config& config, const Ignore& ignore, const SourceTree& tree,
                   const std::vector<BookProject>& books);

        /**
         * @brief Assigns a kind to a path relative to the source root. First matching rule wins.
         */
        Result classify(const std::filesystem::path& relative) const;

        bool in_templates_dir(const std::filesystem::path& relative) const;
        bool is_layout(const std::filesystem::path& relative) const;

        /**
         * @brief Returns the sidecar fragment for a document or layout, if one exists.
         */
        std::optional<std::filesystem::path> sidecar_for(const std::filesystem::path& relative) const;

        /**
         * @brief Returns the document or layout a sidecar fragment belongs to.
         */
        std::optional<std::filesystem::path> sidecar_owner(const std::filesystem::path& relative) const;

        /**
         * @brief Returns the other document that maps to the same output (about.md vs about.html).
         */
        std::optional<std::filesystem::path> twin_of(const std::filesystem::path& relative) const;

    private:
        const Config& m_config;
        const Ignore& m_ignore;
        const SourceTree& m_tree;
        const std::vector<BookProject>& m_books;

        bool in_book(const std::filesystem::path& relative) const;
    };

}
