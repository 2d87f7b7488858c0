#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "data_resolver.hpp"
#include "layout_resolver.hpp"
#include "partials.hpp"

namespace verso::engine {

    inline constexpr const char* kGenerator = "verso";

    /**
     * @brief Converts Markdown to HTML (GitHub dialect).
     * @throws std::runtime_error if the parser fails.
     */
    std::string markdown_to_html(const std::string& markdown);

    /**
     * @brief Converts Markdown in a document that may also contain template tags.
     *
     * {{ }}, {% %} and {# #} spans are kept out of the Markdown pass so that
     * quotes and other markup inside them reach the template engine untouched.
     */
    std::string markdown_preserving_tags(const std::string& markdown);

    /**
     * @brief "Hello, World!" -> "hello-world".
     */
    std::string slugify(const std::string& text);

    /**
     * @brief Inserts `snippet` before the last </body>, else before </html>, else at the end.
     */
    std::string inject_script(const std::string& html, const std::string& snippet);

    /**
     * @brief Renders documents through their layout chain.
     *
     * Not thread-safe: each worker owns its own Renderer. Parsed layouts are
     * cached for the lifetime of the renderer, which is one build pass.
     */
    class Renderer {
    public:
        Renderer(const Config& config, const PartialSet& partials);

        /**
         * @brief Produces the final bytes of a document.
         * @param context Resolved data; `context.destination` must be set.
         * @throws RenderError on a template, Markdown or read failure.
         */
        std::string render(const ResolvedContext& context, const LayoutChain& chain);

        /**
         * @brief Renders a template string with the given data, with partials and helpers available.
         * @throws inja::InjaError on template errors.
         */
        std::string render_string(const std::string& source, const nlohmann::json& data);

        bool live() const { return m_live; }

    private:
        const Config& m_config;
        bool m_live;
        inja::Environment m_env;
        std::map<std::string, inja::Template> m_layouts;

        void register_helpers();
        const inja::Template& layout(const std::filesystem::path& relative);
        nlohmann::json page_data(const ResolvedContext& context) const;
    };

}
