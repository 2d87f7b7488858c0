#include "classifier.hpp"
#include <algorithm>

namespace verso::engine {

    namespace {

        bool has_extension(const std::filesystem::path& p, const std::vector<std::string>& list) {
            auto ext = p.extension().string();
            return std::find(list.begin(), list.end(), ext) != list.end();
        }

        bool starts_with(const std::filesystem::path& path, const std::filesystem::path& prefix) {
            auto it = path.begin();
            for (const auto& part : prefix) {
                if (it == path.end() || *it != part) return false;
                ++it;
            }
            return true;
        }

    }

    bool is_index(const std::filesystem::path& relative) {
        return relative.stem() == kIndexStem;
    }

    bool has_document_extension(const std::filesystem::path& relative) {
        return has_extension(relative, kDocumentExtensions);
    }

    SourceTree::SourceTree(const std::vector<SourceEntry>& entries) {
        for (const auto& e : entries) add(e.relative);
    }

    void SourceTree::add(const std::filesystem::path& relative) {
        m_paths.insert(relative.generic_string());
    }

    bool SourceTree::contains(const std::filesystem::path& relative) const {
        return m_paths.count(relative.generic_string()) > 0;
    }

    std::optional<std::filesystem::path> SourceTree::document_with_stem(const std::filesystem::path& dir,
                                                                       const std::string& stem) const {
        for (const auto& ext : kDocumentExtensions) {
            auto candidate = dir / (stem + ext);
            if (contains(candidate)) return candidate;
        }
        return std::nullopt;
    }

    Classifier::Classifier(const Config& config, const Ignore& ignore, const SourceTree& tree,
                           const std::vector<BookProject>& books)
        : m_config(config), m_ignore(ignore), m_tree(tree), m_books(books) {}

    bool Classifier::in_templates_dir(const std::filesystem::path& relative) const {
        auto it = relative.begin();
        return it != relative.end() && *it == m_config.templates && relative.has_parent_path();
    }

    bool Classifier::is_layout(const std::filesystem::path& relative) const {
        return relative.filename() == m_config.layout;
    }

    bool Classifier::in_book(const std::filesystem::path& relative) const {
        for (const auto& book : m_books) {
            if (book.root.empty() || starts_with(relative, book.root)) return true;
        }
        return false;
    }

    Classifier::Result Classifier::classify(const std::filesystem::path& relative) const {
        Result result;

        if (m_ignore.excludes(relative)) {
            result.kind = SourceKind::Ignored;
            return result;
        }

        if (in_book(relative)) {
            result.kind = SourceKind::Book;
            return result;
        }

        if ((in_templates_dir(relative) && has_extension(relative, kTemplateExtensions)) || is_layout(relative)) {
            if (relative.extension() == kDataExtension && sidecar_owner(relative)) {
                result.warnings.push_back("ClassificationAmbiguous: " + relative.generic_string() +
                                          " is both a template and a data fragment; treating it as a template");
            }
            result.kind = SourceKind::Template;
            return result;
        }

        if (has_document_extension(relative)) {
            result.kind = SourceKind::Document;
            return result;
        }

        if (relative.filename() == kDataFile || (relative.extension() == kDataExtension && sidecar_owner(relative))) {
            result.kind = SourceKind::Data;
            return result;
        }

        result.kind = SourceKind::Passthrough;
        return result;
    }

    std::optional<std::filesystem::path> Classifier::sidecar_for(const std::filesystem::path& relative) const {
        auto sidecar = relative.parent_path() / (relative.stem().string() + kDataExtension);
        if (sidecar.filename() == kDataFile || !m_tree.contains(sidecar)) return std::nullopt;
        auto owner = sidecar_owner(sidecar);
        if (!owner || *owner != relative) return std::nullopt;
        return sidecar;
    }

    std::optional<std::filesystem::path> Classifier::sidecar_owner(const std::filesystem::path& relative) const {
        if (relative.extension() != kDataExtension || relative.filename() == kDataFile) return std::nullopt;

        auto dir = relative.parent_path();
        auto stem = relative.stem().string();
        if (auto doc = m_tree.document_with_stem(dir, stem)) return doc;

        auto layout = dir / m_config.layout;
        if (std::filesystem::path(m_config.layout).stem() == stem && m_tree.contains(layout)) return layout;
        return std::nullopt;
    }

    std::optional<std::filesystem::path> Classifier::twin_of(const std::filesystem::path& relative) const {
        if (!has_document_extension(relative)) return std::nullopt;
        for (const auto& ext : kDocumentExtensions) {
            if (ext == relative.extension().string()) continue;
            auto other = relative;
            other.replace_extension(ext);
            if (m_tree.contains(other)) return other;
        }
        return std::nullopt;
    }

}
