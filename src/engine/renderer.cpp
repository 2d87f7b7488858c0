#include "renderer.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "front_matter.hpp"
#include "reload.hpp"
#include <md4c-html.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace verso::engine {

    namespace {

        void append_output(const MD_CHAR* text, MD_SIZE size, void* userdata) {
            static_cast<std::string*>(userdata)->append(text, size);
        }

        // Tag spans are swapped for \x02<n>\x03, which Markdown leaves alone
        constexpr char kShieldOpen = '\x02';
        constexpr char kShieldClose = '\x03';

        const char* closer_for(char c) {
            switch (c) {
                case '{': return "}}";
                case '%': return "%}";
                case '#': return "#}";
                default: return nullptr;
            }
        }

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string url_for(const std::filesystem::path& destination) {
            auto url = "/" + destination.generic_string();
            const std::string index = "index.html";
            if (url.size() >= index.size() && url.compare(url.size() - index.size(), index.size(), index) == 0) {
                url.erase(url.size() - index.size());
            }
            return url;
        }

    }

    std::string markdown_to_html(const std::string& markdown) {
        std::string html;
        int ret = md_html(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
                          append_output, &html, MD_DIALECT_GITHUB, 0);
        if (ret != 0) {
            throw std::runtime_error("Markdown parsing failed");
        }
        return html;
    }

    std::string markdown_preserving_tags(const std::string& markdown) {
        std::vector<std::string> spans;
        std::string shielded;
        shielded.reserve(markdown.size());

        size_t pos = 0;
        while (pos < markdown.size()) {
            auto open = markdown.find('{', pos);
            if (open == std::string::npos || open + 1 >= markdown.size()) {
                shielded.append(markdown, pos, std::string::npos);
                break;
            }
            const char* closer = closer_for(markdown[open + 1]);
            auto close = closer ? markdown.find(closer, open + 2) : std::string::npos;
            if (close == std::string::npos) {
                shielded.append(markdown, pos, open + 1 - pos);
                pos = open + 1;
                continue;
            }
            shielded.append(markdown, pos, open - pos);
            shielded += kShieldOpen;
            shielded += std::to_string(spans.size());
            shielded += kShieldClose;
            spans.push_back(markdown.substr(open, close + 2 - open));
            pos = close + 2;
        }

        auto html = markdown_to_html(shielded);
        if (spans.empty()) return html;

        std::string restored;
        restored.reserve(html.size());
        pos = 0;
        while (pos < html.size()) {
            auto open = html.find(kShieldOpen, pos);
            auto close = open == std::string::npos ? std::string::npos : html.find(kShieldClose, open);
            if (close == std::string::npos) {
                restored.append(html, pos, std::string::npos);
                break;
            }
            restored.append(html, pos, open - pos);
            auto index = std::stoul(html.substr(open + 1, close - open - 1));
            restored += spans.at(index);
            pos = close + 1;
        }
        return restored;
    }

    std::string slugify(const std::string& text) {
        std::string slug;
        bool pending_dash = false;
        for (unsigned char c : text) {
            if (std::isalnum(c)) {
                if (pending_dash && !slug.empty()) slug += '-';
                slug += static_cast<char>(std::tolower(c));
                pending_dash = false;
            } else {
                pending_dash = true;
            }
        }
        return slug;
    }

    std::string inject_script(const std::string& html, const std::string& snippet) {
        auto lower = lowercase(html);
        auto pos = lower.rfind("</body>");
        if (pos == std::string::npos) pos = lower.rfind("</html>");
        if (pos == std::string::npos) return html + snippet;

        std::string result = html;
        result.insert(pos, snippet);
        return result;
    }

    Renderer::Renderer(const Config& config, const PartialSet& partials)
        : m_config(config), m_live(config.live.enabled) {
        m_env.set_search_included_templates_in_files(false);
        m_env.set_throw_at_missing_includes(true);

        for (const auto& [name, content] : partials.templates()) {
            try {
                m_env.include_template(name, m_env.parse(content));
            } catch (const inja::InjaError& e) {
                throw RenderError(std::filesystem::path(m_config.templates) / name, e.what());
            }
        }
        register_helpers();
    }

    void Renderer::register_helpers() {
        m_env.add_callback("markdown", 1, [](inja::Arguments& args) {
            return markdown_to_html(args.at(0)->get<std::string>());
        });
        m_env.add_callback("slug", 1, [](inja::Arguments& args) {
            return slugify(args.at(0)->get<std::string>());
        });
        m_env.add_callback("livereload", 0, [this](inja::Arguments&) {
            return m_live ? livereload_tag() : std::string();
        });
    }

    const inja::Template& Renderer::layout(const std::filesystem::path& relative) {
        auto key = relative.generic_string();
        auto it = m_layouts.find(key);
        if (it != m_layouts.end()) return it->second;

        auto parsed = m_env.parse(files::read(m_config.source / relative));
        return m_layouts.emplace(key, std::move(parsed)).first->second;
    }

    nlohmann::json Renderer::page_data(const ResolvedContext& context) const {
        auto data = context.data;
        data["context"] = {
            {"tag", m_config.tag},
            {"release", m_config.release},
            {"live", m_live},
            {"generator", kGenerator}
        };
        data["file"] = {
            {"source", context.document.relative.generic_string()},
            {"target", context.destination.generic_string()},
            {"url", url_for(context.destination)},
            {"name", context.document.relative.filename().string()}
        };
        return data;
    }

    std::string Renderer::render_string(const std::string& source, const nlohmann::json& data) {
        return m_env.render(m_env.parse(source), data);
    }

    std::string Renderer::render(const ResolvedContext& context, const LayoutChain& chain) {
        const auto& document = context.document.relative;
        auto data = page_data(context);
        std::string output;

        try {
            auto source = context.body ? *context.body
                                       : split_front_matter(files::read(context.document.path), document).body;
            if (document.extension() == ".md") {
                source = markdown_preserving_tags(source);
            }
            output = render_string(source, data);
        } catch (const inja::InjaError& e) {
            throw RenderError(document, e.what());
        } catch (const nlohmann::json::exception& e) {
            throw RenderError(document, e.what());
        } catch (const std::ios_base::failure& e) {
            throw RenderError(document, e.what());
        } catch (const BuildError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw RenderError(document, e.what());
        }

        for (const auto& layout_path : chain) {
            data["template"] = output;
            try {
                output = m_env.render(layout(layout_path), data);
            } catch (const inja::InjaError& e) {
                throw RenderError(document, "in layout " + layout_path.generic_string() + ": " + e.what());
            } catch (const nlohmann::json::exception& e) {
                throw RenderError(document, "in layout " + layout_path.generic_string() + ": " + e.what());
            } catch (const std::ios_base::failure& e) {
                throw RenderError(document, "cannot read layout " + layout_path.generic_string() + ": " + e.what());
            }
        }

        if (m_live && output.find(kScriptPath) == std::string::npos) {
            output = inject_script(output, livereload_tag());
        }
        return output;
    }

}
