#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "classifier.hpp"
#include "config.hpp"
#include "data_resolver.hpp"
#include "directory_cache.hpp"

namespace verso::engine {

    // Layout template paths relative to the source root, nearest first
    using LayoutChain = std::vector<std::filesystem::path>;

    struct LayoutResolution {
        LayoutChain chain;
        std::vector<Dependency> dependencies;
        std::vector<std::string> warnings;
    };

    class LayoutResolver {
    public:
        LayoutResolver(const Config& config, DirectoryCache& cache, const Classifier& classifier,
                       const SourceTree& tree);

        /**
         * @brief Builds the layout chain for a resolved document.
         *
         * Standalone documents and documents without any ancestor layout get
         * an empty chain. Only the nearest layout applies unless its
         * layout.json sets "inherit": true.
         * @throws LayoutError if an explicit layout is missing or is not a
         * template, or if a layout would be applied twice.
         */
        LayoutResolution resolve(const ResolvedContext& context) const;

    private:
        const Config& m_config;
        DirectoryCache& m_cache;
        const Classifier& m_classifier;
        const SourceTree& m_tree;

        // Nearest directory layout at or above `dir`, walking up to the source root
        std::shared_ptr<const DirectoryInfo> find_upwards(const std::filesystem::path& dir) const;
        void validate_explicit(const std::filesystem::path& document, const std::filesystem::path& layout) const;
    };

}
