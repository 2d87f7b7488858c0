#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "book.hpp"
#include "config.hpp"
#include "reload.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    struct Diagnostic {
        enum class Severity { Warning, Error };

        Severity severity = Severity::Warning;
        std::filesystem::path path; // Relative to the source root, may be empty
        std::string message;
    };

    /**
     * @brief Outcome of one build pass.
     */
    struct BuildReport {
        size_t rendered = 0;
        size_t skipped = 0;     // Up to date ("noop")
        size_t warned = 0;      // Documents with at least one warning
        size_t failed = 0;
        size_t drafts = 0;      // Left out of a release build
        size_t copied = 0;
        size_t assets_skipped = 0;
        size_t assets_failed = 0;
        size_t books = 0;
        size_t books_skipped = 0;
        size_t books_failed = 0;
        size_t redirects = 0;   // Redirect pages written
        size_t redirects_failed = 0;
        size_t removed = 0;     // Outputs of sources that disappeared or moved

        bool fatal = false;
        std::string fatal_message;
        std::vector<Diagnostic> diagnostics;

        size_t documents() const { return rendered + skipped + failed + drafts; }
        bool ok() const { return !fatal && failed == 0 && assets_failed == 0 && books_failed == 0 &&
                                 redirects_failed == 0; }
        int exit_code() const { return ok() ? 0 : 1; }
        size_t errors() const;
        std::string summary() const;
    };

    /**
     * @brief Runs build passes: scan, classify, resolve, render, copy, books, manifest.
     *
     * A pass never throws. Whole-build failures are reported through
     * BuildReport::fatal; per-document failures through diagnostics.
     */
    class Builder {
    public:
        explicit Builder(const Config& config, std::unique_ptr<BookCompiler> compiler = nullptr);

        BuildReport run();

    private:
        const Config& m_config;
        BookDelegate m_books;

        void execute(BuildReport& report);
    };

    /**
     * @brief Runs one pass and tells connected browsers about it: start, then a
     * notification with the summary, then a reload if the pass succeeded.
     */
    BuildReport build_and_notify(Builder& builder, ReloadCoordinator& coordinator);

}
