#include "destination.hpp"
#include "errors.hpp"

namespace verso::engine {

    DestinationPlanner::DestinationPlanner(const Config& config, const SourceTree& tree, const Classifier& classifier)
        : m_config(config), m_tree(tree), m_classifier(classifier) {}

    Destination DestinationPlanner::plan(const SourceEntry& entry, std::optional<bool> clean) const {
        Destination dest;
        const auto& rel = entry.relative;

        if (entry.kind != SourceKind::Document) {
            dest.path = rel;
            return dest;
        }

        if (auto twin = m_classifier.twin_of(rel)) {
            throw RenderError(rel, "file name collision: " + rel.generic_string() + " and " +
                                   twin->generic_string() + " map to the same output");
        }

        auto dir = rel.parent_path();
        auto stem = rel.stem().string();

        if (is_index(rel) || !clean.value_or(m_config.clean_url)) {
            dest.path = dir / (stem + ".html");
            return dest;
        }

        if (m_tree.document_with_stem(dir / stem, kIndexStem)) {
            dest.path = dir / (stem + ".html");
            dest.demoted = true;
            return dest;
        }

        dest.path = dir / stem / "index.html";
        return dest;
    }

}
