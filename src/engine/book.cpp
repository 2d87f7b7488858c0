#include "book.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "../platform.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace verso::engine {

    namespace {

        constexpr const char* kThemeVariable = "MDBOOK_OUTPUT__HTML__THEME";

        class MdBookCompiler : public BookCompiler {
        public:
            explicit MdBookCompiler(std::string command) : m_command(std::move(command)) {}

            void compile(const BookRequest& request) override {
                std::vector<std::pair<std::string, std::string>> env;
                if (request.theme) env.emplace_back(kThemeVariable, request.theme->string());

                auto result = platform::run_process(
                    {m_command, "build", request.source.string(), "--dest-dir", request.output.string()}, env);

                if (!result.launched) {
                    throw BookError(request.source, "could not run '" + m_command + "'" +
                                                    (result.output.empty() ? "" : ": " + result.output));
                }
                if (result.exit_code != 0) {
                    throw BookError(request.source, "'" + m_command + "' exited with status " +
                                                    std::to_string(result.exit_code) + ":\n" + result.output);
                }
            }

        private:
            std::string m_command;
        };

    }

    std::unique_ptr<BookCompiler> create_mdbook_compiler(const std::string& command) {
        return std::make_unique<MdBookCompiler>(command);
    }

    BookDelegate::BookDelegate(const Config& config, std::unique_ptr<BookCompiler> compiler)
        : m_config(config), m_compiler(std::move(compiler)) {}

    std::filesystem::path BookDelegate::scratch_dir(const BookProject& book) const {
        auto name = book.root.empty() ? std::string("_root") : book.root.generic_string();
        std::replace(name.begin(), name.end(), '/', '_');
        return std::filesystem::absolute(m_config.build / (".books-" + m_config.tag) / name);
    }

    std::int64_t BookDelegate::newest(const BookProject& book) const {
        // File times may precede the clock epoch, so ticks can be negative
        std::int64_t latest = std::numeric_limits<std::int64_t>::min();
        auto root = m_config.source / book.root;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            latest = std::max(latest, to_ticks(it->last_write_time()));
        }
        return latest;
    }

    BookOutput BookDelegate::build(const BookProject& book) {
        BookOutput output;

        BookRequest request;
        request.source = std::filesystem::absolute(m_config.source / book.root);
        request.output = scratch_dir(book);

        if (!m_config.book.theme.empty()) {
            auto theme = std::filesystem::absolute(m_config.source / m_config.book.theme);
            if (std::filesystem::is_directory(theme)) {
                request.theme = theme;
            } else {
                output.warnings.push_back("missing book theme directory " + theme.string());
            }
        }

        std::error_code ec;
        std::filesystem::remove_all(request.output, ec);

        std::cout << "[Books] build " << (book.root.empty() ? "." : book.root.generic_string()) << "\n";
        m_compiler->compile(request);

        try {
            for (auto& file : files::copy_tree(request.output, m_config.target() / book.root)) {
                output.files.push_back(book.root / file);
            }
        } catch (const std::filesystem::filesystem_error& e) {
            throw BookError(book.root, std::string("cannot copy book output: ") + e.what());
        }

        std::filesystem::remove_all(request.output, ec);
        return output;
    }

}
