#include "builder.hpp"
#include "classifier.hpp"
#include "data_resolver.hpp"
#include "destination.hpp"
#include "directory_cache.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "job_queue.hpp"
#include "layout_resolver.hpp"
#include "manifest.hpp"
#include "partials.hpp"
#include "redirect.hpp"
#include "renderer.hpp"
#include "scanner.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>
#include <sstream>
#include <thread>

namespace verso::engine {

    namespace {

        // One slot per document, written by exactly one worker
        struct DocumentOutcome {
            enum class Status { Pending, Rendered, Skipped, Draft, Failed };

            Status status = Status::Pending;
            std::filesystem::path destination;
            std::optional<ManifestEntry> entry;
            std::vector<std::string> warnings;
            std::filesystem::path error_path;
            std::string error;
        };

        struct Pipeline {
            const Config& config;
            DataResolver& data;
            LayoutResolver& layouts;
            DestinationPlanner& planner;
            const BuildManifest& manifest;
        };

        void process_document(const Pipeline& pipe, Renderer& renderer, const SourceEntry& entry,
                              DocumentOutcome& outcome) {
            try {
                auto context = pipe.data.resolve(entry);
                outcome.warnings = context.warnings;

                if (context.draft && pipe.config.release) {
                    outcome.status = DocumentOutcome::Status::Draft;
                    return;
                }

                auto layout = pipe.layouts.resolve(context);
                outcome.warnings.insert(outcome.warnings.end(), layout.warnings.begin(), layout.warnings.end());

                auto destination = pipe.planner.plan(entry, context.clean);
                context.destination = destination.path;
                outcome.destination = destination.path;

                auto dependencies = context.dependencies;
                dependencies.insert(dependencies.end(), layout.dependencies.begin(), layout.dependencies.end());

                if (!pipe.manifest.is_stale(entry, destination.path, dependencies)) {
                    outcome.status = DocumentOutcome::Status::Skipped;
                    return;
                }

                auto html = renderer.render(context, layout.chain);
                try {
                    files::write(pipe.config.target() / destination.path, html);
                } catch (const std::ios_base::failure& e) {
                    throw RenderError(entry.relative, e.what());
                }

                outcome.entry = pipe.manifest.make_entry(entry, destination.path, std::move(dependencies));
                outcome.status = DocumentOutcome::Status::Rendered;
            } catch (const BuildError& e) {
                outcome.status = DocumentOutcome::Status::Failed;
                outcome.error_path = e.path();
                outcome.error = e.what();
            } catch (const std::exception& e) {
                outcome.status = DocumentOutcome::Status::Failed;
                outcome.error_path = entry.relative;
                outcome.error = e.what();
            }
        }

        void add_warnings(BuildReport& report, const std::filesystem::path& path,
                          const std::vector<std::string>& warnings) {
            for (const auto& w : warnings) {
                report.diagnostics.push_back({Diagnostic::Severity::Warning, path, w});
                std::cerr << "[Builder] warning: " << path.generic_string() << ": " << w << "\n";
            }
        }

        void add_error(BuildReport& report, const std::filesystem::path& path, const std::string& message) {
            report.diagnostics.push_back({Diagnostic::Severity::Error, path, message});
            std::cerr << "[Builder] error: " << path.generic_string() << ": " << message << "\n";
        }

        void remove_output(const std::filesystem::path& file) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(file, ec)) {
                std::filesystem::remove(file, ec);
                if (ec) std::cerr << "[Builder] Cannot remove " << file << ": " << ec.message() << "\n";
            }
        }

    }

    size_t BuildReport::errors() const {
        return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
            return d.severity == Diagnostic::Severity::Error;
        }));
    }

    std::string BuildReport::summary() const {
        std::ostringstream out;
        if (fatal) {
            out << "build failed: " << fatal_message;
            return out.str();
        }
        out << rendered << " rendered, " << skipped << " skipped, " << warned << " warned, " << failed << " failed";
        if (drafts) out << ", " << drafts << " drafts";
        out << "; " << copied << " assets copied";
        if (assets_failed) out << " (" << assets_failed << " failed)";
        if (books || books_skipped || books_failed) {
            out << "; " << books << " books built";
            if (books_failed) out << " (" << books_failed << " failed)";
        }
        if (redirects || redirects_failed) {
            out << "; " << redirects << " redirects";
            if (redirects_failed) out << " (" << redirects_failed << " failed)";
        }
        return out.str();
    }

    Builder::Builder(const Config& config, std::unique_ptr<BookCompiler> compiler)
        : m_config(config),
          m_books(config, compiler ? std::move(compiler) : create_mdbook_compiler(config.book.command)) {}

    BuildReport Builder::run() {
        BuildReport report;
        auto started = std::chrono::steady_clock::now();

        try {
            execute(report);
        } catch (const FatalError& e) {
            report.fatal = true;
            report.fatal_message = e.path().empty() ? e.what() : e.path().string() + ": " + e.what();
        } catch (const std::filesystem::filesystem_error& e) {
            report.fatal = true;
            report.fatal_message = e.what();
        }

        if (report.fatal) {
            std::cerr << "[Builder] " << report.summary() << "\n";
            return report;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cout << "[Builder] " << report.summary() << " (" << elapsed.count() << "ms)\n";
        return report;
    }

    void Builder::execute(BuildReport& report) {
        const auto target = m_config.target();

        for (const auto& w : m_config.warnings) {
            add_warnings(report, "site.json", {w});
        }
        if (m_config.release && m_config.live.enabled) {
            add_warnings(report, "", {"live reload requested for release tag '" + m_config.tag + "'"});
        }

        std::vector<Redirect> redirects;
        try {
            redirects = plan_redirects(m_config.redirect);
        } catch (const ConfigError& e) {
            throw FatalError(e.path(), e.what());
        }

        Scanner scanner(m_config);
        auto scan = scanner.scan(m_config.source);

        std::error_code ec;
        std::filesystem::create_directories(target, ec);
        if (ec || !std::filesystem::is_directory(target)) {
            throw FatalError(target, "cannot create destination: " + (ec ? ec.message() : "not a directory"));
        }

        SourceTree tree(scan.entries);
        Classifier classifier(m_config, scanner.ignore(), tree, scan.books);

        std::vector<SourceEntry> documents;
        std::vector<SourceEntry> assets;
        for (auto& entry : scan.entries) {
            auto result = classifier.classify(entry.relative);
            entry.kind = result.kind;
            add_warnings(report, entry.relative, result.warnings);
            if (entry.kind == SourceKind::Document) documents.push_back(entry);
            else if (entry.kind == SourceKind::Passthrough) assets.push_back(entry);
        }

        BuildManifest manifest(m_config);
        manifest.load();
        add_warnings(report, m_config.manifest_file().filename(), manifest.warnings());

        PartialSet partials;
        try {
            partials = PartialSet::load(m_config.templates_dir());
        } catch (const std::ios_base::failure& e) {
            throw FatalError(m_config.templates_dir(), e.what());
        }
        manifest.set_partials(partials.signature());

        // A broken partial breaks every page that includes it
        try {
            Renderer check(m_config, partials);
        } catch (const RenderError& e) {
            throw FatalError(e.path(), e.what());
        }

        DirectoryCache cache(m_config, m_config.source, scanner.ignore());
        DataResolver data(m_config, cache, classifier);
        LayoutResolver layouts(m_config, cache, classifier, tree);
        DestinationPlanner planner(m_config, tree, classifier);
        Pipeline pipe{m_config, data, layouts, planner, manifest};

        std::vector<DocumentOutcome> outcomes(documents.size());
        JobQueue<size_t> queue;
        for (size_t i = 0; i < documents.size(); ++i) queue.push(i);
        queue.stop();

        size_t worker_count = std::max<size_t>(1, std::min(m_config.worker_count(), documents.size()));
        std::vector<std::thread> workers;
        for (size_t w = 0; w < worker_count && !documents.empty(); ++w) {
            workers.emplace_back([&]() {
                Renderer renderer(m_config, partials);
                size_t index;
                while (queue.pop(index)) {
                    process_document(pipe, renderer, documents[index], outcomes[index]);
                }
            });
        }
        for (auto& t : workers) t.join();

        // Barrier: single writer from here on
        std::set<std::string> live;
        // Outputs some source owns after this pass, never deleted as stale
        std::set<std::string> claimed;
        std::vector<std::filesystem::path> moved;
        for (size_t i = 0; i < documents.size(); ++i) {
            const auto& entry = documents[i];
            auto& outcome = outcomes[i];

            if (!outcome.warnings.empty()) {
                ++report.warned;
                add_warnings(report, entry.relative, outcome.warnings);
            }

            switch (outcome.status) {
                case DocumentOutcome::Status::Rendered:
                    ++report.rendered;
                    std::cout << "[Builder] " << entry.relative.generic_string() << " -> "
                              << outcome.destination.generic_string() << "\n";
                    if (const auto* previous = manifest.find(entry.relative);
                        previous && previous->destination != outcome.destination) {
                        moved.push_back(previous->destination);
                    }
                    manifest.record(std::move(*outcome.entry));
                    live.insert(entry.relative.generic_string());
                    claimed.insert(outcome.destination.generic_string());
                    break;
                case DocumentOutcome::Status::Skipped:
                    ++report.skipped;
                    std::cout << "[Builder] noop " << entry.relative.generic_string() << "\n";
                    live.insert(entry.relative.generic_string());
                    claimed.insert(outcome.destination.generic_string());
                    break;
                case DocumentOutcome::Status::Draft:
                    ++report.drafts;
                    std::cout << "[Builder] draft " << entry.relative.generic_string() << "\n";
                    break;
                case DocumentOutcome::Status::Failed:
                case DocumentOutcome::Status::Pending:
                    // The previous entry stays so the document is retried next pass
                    ++report.failed;
                    add_error(report, outcome.error_path.empty() ? entry.relative : outcome.error_path,
                              outcome.error);
                    live.insert(entry.relative.generic_string());
                    if (const auto* previous = manifest.find(entry.relative)) {
                        claimed.insert(previous->destination.generic_string());
                    }
                    break;
            }
        }

        if (!documents.empty() && report.failed == documents.size()) {
            throw FatalError(m_config.source, "every document failed (" + std::to_string(report.failed) + ")");
        }

        for (const auto& entry : assets) {
            live.insert(entry.relative.generic_string());
            auto destination = planner.plan(entry).path;
            claimed.insert(destination.generic_string());
            if (!manifest.is_stale(entry, destination, {})) {
                ++report.assets_skipped;
                continue;
            }
            try {
                files::copy(entry.path, target / destination);
                manifest.record(manifest.make_entry(entry, destination, {}));
                ++report.copied;
            } catch (const std::filesystem::filesystem_error& e) {
                ++report.assets_failed;
                add_error(report, entry.relative, e.what());
            }
        }

        for (const auto& book : scan.books) {
            live.insert(book.marker.generic_string());

            SourceEntry marker;
            marker.relative = book.marker;
            marker.path = m_config.source / book.marker;
            marker.kind = SourceKind::Book;
            marker.last_write_time = from_ticks(m_books.newest(book));

            if (!manifest.is_stale(marker, book.root, {})) {
                ++report.books_skipped;
                std::cout << "[Builder] noop " << book.marker.generic_string() << "\n";
                continue;
            }
            try {
                auto output = m_books.build(book);
                add_warnings(report, book.root, output.warnings);
                for (const auto& file : output.files) claimed.insert(file.generic_string());
                manifest.record(manifest.make_entry(marker, book.root, {}));
                ++report.books;
            } catch (const BuildError& e) {
                ++report.books_failed;
                add_error(report, e.path().empty() ? book.root : e.path(), e.what());
            }
        }

        for (const auto& redirect : redirects) {
            const auto key = kRedirectKeyPrefix + redirect.from;
            live.insert(key);

            if (claimed.count(redirect.destination.generic_string())) {
                ++report.redirects_failed;
                add_error(report, "site.json", "redirect " + redirect.from + " would overwrite " +
                                               redirect.destination.generic_string());
                continue;
            }
            claimed.insert(redirect.destination.generic_string());

            auto page = redirect_page(redirect.to);
            auto file = target / redirect.destination;
            std::string existing;
            if (std::filesystem::is_regular_file(file)) {
                try {
                    existing = files::read(file);
                } catch (const std::ios_base::failure&) {
                    existing.clear(); // Unreadable: rewrite it
                }
            }
            if (existing != page) {
                try {
                    files::write(file, page);
                } catch (const std::ios_base::failure& e) {
                    ++report.redirects_failed;
                    add_error(report, "site.json", "redirect " + redirect.from + ": " + e.what());
                    continue;
                }
                ++report.redirects;
                std::cout << "[Builder] " << redirect.from << " -> " << redirect.to << " as "
                          << redirect.destination.generic_string() << "\n";
            }

            SourceEntry marker;
            marker.relative = key;
            marker.kind = SourceKind::Data;
            manifest.record(manifest.make_entry(marker, redirect.destination, {}));
        }

        if (m_config.live.enabled) {
            try {
                files::write(target / kScriptFile, livereload_script());
            } catch (const std::ios_base::failure& e) {
                throw FatalError(target / kScriptFile, e.what());
            }
        }

        for (const auto& stale : manifest.prune(live)) {
            // Book outputs are directories shared with other content
            if (stale.source.filename() == kBookMarker) continue;
            if (claimed.count(stale.destination.generic_string())) continue;
            remove_output(target / stale.destination);
            ++report.removed;
        }
        for (const auto& old : moved) {
            if (claimed.count(old.generic_string())) continue;
            remove_output(target / old);
            ++report.removed;
        }

        manifest.save();
    }

    BuildReport build_and_notify(Builder& builder, ReloadCoordinator& coordinator) {
        coordinator.broadcast(ReloadEvent::start());
        auto report = builder.run();
        coordinator.broadcast(ReloadEvent::notify(report.summary(), !report.ok()));
        if (report.ok()) {
            coordinator.broadcast(ReloadEvent::reload());
        }
        return report;
    }

}
