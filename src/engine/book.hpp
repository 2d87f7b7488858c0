#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "verso/types.hpp"

namespace verso::engine {

    struct BookRequest {
        std::filesystem::path source;              // Absolute book root
        std::filesystem::path output;              // Absolute scratch directory to build into
        std::optional<std::filesystem::path> theme; // Absolute theme directory
    };

    /**
     * @brief Abstract interface for the external book compiler.
     */
    class BookCompiler {
    public:
        virtual ~BookCompiler() = default;

        /**
         * @brief Builds one book into request.output.
         * @throws BookError if the compiler cannot run or fails.
         */
        virtual void compile(const BookRequest& request) = 0;
    };

    /**
     * @brief Compiler that runs `<command> build <source> --dest-dir <output>`.
     * The theme is passed through MDBOOK_OUTPUT__HTML__THEME.
     */
    std::unique_ptr<BookCompiler> create_mdbook_compiler(const std::string& command);

    struct BookOutput {
        std::vector<std::filesystem::path> files; // Relative to the destination root
        std::vector<std::string> warnings;
    };

    class BookDelegate {
    public:
        BookDelegate(const Config& config, std::unique_ptr<BookCompiler> compiler);

        /**
         * @brief Compiles a book subtree and copies the result to <destination>/<book root>.
         * @throws BookError on compiler or copy failure.
         */
        BookOutput build(const BookProject& book);

        /**
         * @brief Newest modification time of any file in the book subtree, in ticks.
         * Ticks may be negative. An empty subtree yields the lowest representable value.
         */
        std::int64_t newest(const BookProject& book) const;

    private:
        const Config& m_config;
        std::unique_ptr<BookCompiler> m_compiler;

        std::filesystem::path scratch_dir(const BookProject& book) const;
    };

}
