#pragma once

#include <filesystem>
#include "classifier.hpp"
#include "config.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    struct Destination {
        std::filesystem::path path; // Relative to the destination root
        bool demoted = false;       // Clean URL fell back to <stem>.html
    };

    /**
     * @brief Maps source entries to their output paths.
     */
    class DestinationPlanner {
    public:
        DestinationPlanner(const Config& config, const SourceTree& tree, const Classifier& classifier);

        /**
         * @brief Computes the output path for one entry.
         *
         * Documents get a .html extension. With clean URLs a non-index
         * document `a/about.md` goes to `a/about/index.html` unless the
         * directory `a/about/` has its own index document, in which case it is
         * demoted to `a/about.html`. Everything else keeps its relative path.
         * @param clean Per-document override of the site clean URL policy.
         * @throws RenderError if another document in the same directory maps to the same output.
         */
        Destination plan(const SourceEntry& entry, std::optional<bool> clean = std::nullopt) const;

    private:
        const Config& m_config;
        const SourceTree& m_tree;
        const Classifier& m_classifier;
    };

}
