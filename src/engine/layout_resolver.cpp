#include "layout_resolver.hpp"
#include "errors.hpp"
#include <algorithm>

namespace verso::engine {

    LayoutResolver::LayoutResolver(const Config& config, DirectoryCache& cache, const Classifier& classifier,
                                   const SourceTree& tree)
        : m_config(config), m_cache(cache), m_classifier(classifier), m_tree(tree) {}

    std::shared_ptr<const DirectoryInfo> LayoutResolver::find_upwards(const std::filesystem::path& dir) const {
        auto dirs = ancestor_dirs(dir);
        for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
            auto info = m_cache.get(*it);
            if (info->layout) return info;
        }
        return nullptr;
    }

    void LayoutResolver::validate_explicit(const std::filesystem::path& document,
                                           const std::filesystem::path& layout) const {
        if (!m_tree.contains(layout)) {
            throw LayoutError(document, "layout '" + layout.generic_string() + "' does not exist");
        }
        auto kind = m_classifier.classify(layout).kind;
        if (kind != SourceKind::Template) {
            throw LayoutError(document, "layout '" + layout.generic_string() + "' is a " + to_string(kind) +
                                        ", not a template");
        }
    }

    LayoutResolution LayoutResolver::resolve(const ResolvedContext& context) const {
        LayoutResolution result;
        if (context.standalone) return result;

        const auto& document = context.document.relative;
        std::shared_ptr<const DirectoryInfo> info;

        if (context.layout) {
            validate_explicit(document, *context.layout);
            auto owner = m_cache.get(context.layout->parent_path());
            result.chain.push_back(*context.layout);
            if (owner->layout && *owner->layout == *context.layout) {
                info = owner;
            } else {
                // A named partial used as a layout does not chain
                std::error_code ec;
                auto time = std::filesystem::last_write_time(m_config.source / *context.layout, ec);
                result.dependencies.push_back({*context.layout, ec ? 0 : to_ticks(time)});
                return result;
            }
        } else {
            info = find_upwards(document.parent_path());
            if (!info) return result;
            result.chain.push_back(*info->layout);
        }

        while (true) {
            if (!info->layout_error.empty()) {
                throw LayoutError(*info->options_file, info->layout_error);
            }
            result.dependencies.push_back({*info->layout, info->layout_modified});
            if (info->options_file) {
                result.dependencies.push_back({*info->options_file, info->options_modified});
            }
            result.warnings.insert(result.warnings.end(), info->layout_warnings.begin(), info->layout_warnings.end());

            if (!info->inherit || info->dir.empty()) break;

            auto next = find_upwards(info->dir.parent_path());
            if (!next) break;
            if (std::find(result.chain.begin(), result.chain.end(), *next->layout) != result.chain.end()) {
                throw LayoutError(document, "layout '" + next->layout->generic_string() + "' applied twice");
            }
            result.chain.push_back(*next->layout);
            info = next;
        }

        return result;
    }

}
