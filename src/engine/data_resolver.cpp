#include "data_resolver.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "front_matter.hpp"
#include <cctype>

namespace verso::engine {

    namespace {

        // Reads a boolean flag; anything else is dropped with a warning.
        std::optional<bool> take_flag(nlohmann::json& data, const char* key, std::vector<std::string>& warnings) {
            if (!data.contains(key)) return std::nullopt;
            if (data[key].is_boolean()) return data[key].get<bool>();
            warnings.push_back(std::string("ignoring non-boolean value for '") + key + "': " + data[key].dump());
            data.erase(key);
            return std::nullopt;
        }

    }

    void merge_data(nlohmann::json& base, const nlohmann::json& overlay) {
        if (!overlay.is_object()) return;
        for (const auto& item : overlay.items()) {
            base[item.key()] = item.value();
        }
    }

    std::string humanize(const std::string& name) {
        std::string result;
        bool word_start = true;
        for (char c : name) {
            if (c == '-' || c == '_' || c == ' ') {
                if (!result.empty() && result.back() != ' ') result += ' ';
                word_start = true;
                continue;
            }
            result += word_start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            word_start = false;
        }
        while (!result.empty() && result.back() == ' ') result.pop_back();
        return result;
    }

    DataResolver::DataResolver(const Config& config, DirectoryCache& cache, const Classifier& classifier)
        : m_config(config), m_cache(cache), m_classifier(classifier) {}

    ResolvedContext DataResolver::resolve(const SourceEntry& document) const {
        ResolvedContext ctx;
        ctx.document = document;
        ctx.data = m_config.page.is_object() ? m_config.page : nlohmann::json::object();

        std::vector<std::shared_ptr<const DirectoryInfo>> chain;
        for (const auto& dir : ancestor_dirs(document.relative.parent_path())) {
            auto info = m_cache.get(dir);
            if (!info->error.empty()) {
                throw ConfigError(info->fragment_path(), info->error);
            }
            if (info->has_fragment) {
                merge_data(ctx.data, info->data);
                ctx.dependencies.push_back({info->fragment_path(), info->fragment_modified});
            }
            chain.push_back(std::move(info));
        }

        for (const auto& info : chain) {
            apply_pages(*info, document.relative, ctx.data);
        }

        std::string text;
        try {
            text = files::read(document.path);
        } catch (const std::ios_base::failure& e) {
            throw ConfigError(document.relative, e.what());
        }
        auto front = split_front_matter(text, document.relative);
        if (front.present) {
            if (auto reserved = find_reserved_key(front.data)) {
                throw ConfigError(document.relative, *reserved + " (front matter)");
            }
            merge_data(ctx.data, front.data);
        }
        ctx.body = std::move(front.body);

        if (auto sidecar = m_classifier.sidecar_for(document.relative)) {
            auto path = document.path.parent_path() / sidecar->filename();
            nlohmann::json fragment;
            try {
                fragment = nlohmann::json::parse(files::read(path));
            } catch (const nlohmann::json::parse_error& e) {
                throw ConfigError(*sidecar, std::string("malformed configuration fragment: ") + e.what());
            } catch (const std::ios_base::failure& e) {
                throw ConfigError(*sidecar, e.what());
            }
            if (!fragment.is_object()) {
                throw ConfigError(*sidecar, "configuration fragment must be a JSON object");
            }
            if (auto reserved = find_reserved_key(fragment)) {
                throw ConfigError(*sidecar, *reserved);
            }
            merge_data(ctx.data, fragment);

            std::error_code ec;
            auto time = std::filesystem::last_write_time(path, ec);
            ctx.dependencies.push_back({*sidecar, ec ? 0 : to_ticks(time)});
        }

        if (auto reserved = find_reserved_key(m_config.page)) {
            throw ConfigError(document.relative, *reserved + " (site page table)");
        }

        ctx.standalone = take_flag(ctx.data, "standalone", ctx.warnings).value_or(false);
        ctx.draft = take_flag(ctx.data, "draft", ctx.warnings).value_or(false);
        ctx.clean = take_flag(ctx.data, "clean", ctx.warnings);

        if (ctx.data.contains("layout")) {
            if (ctx.data["layout"].is_string()) {
                ctx.layout = std::filesystem::path(ctx.data["layout"].get<std::string>()).lexically_normal();
            } else {
                ctx.warnings.push_back("ignoring non-string value for 'layout'");
            }
        }

        if (ctx.data.contains("title") && ctx.data["title"].is_string()) {
            ctx.title = ctx.data["title"].get<std::string>();
        } else {
            if (ctx.data.contains("title")) {
                ctx.warnings.push_back("ignoring non-string value for 'title'");
            }
            ctx.title = infer_title(document);
            ctx.data["title"] = ctx.title;
        }

        return ctx;
    }

    void DataResolver::apply_pages(const DirectoryInfo& info, const std::filesystem::path& document,
                                   nlohmann::json& data) const {
        if (info.pages.empty()) return;

        auto sub = info.dir.empty() ? document : document.lexically_relative(info.dir);
        auto bare = sub;
        bare.replace_extension();

        // Least specific first so the exact file name wins
        for (const auto& key : {bare.generic_string(), sub.generic_string()}) {
            auto it = info.pages.find(key);
            if (it != info.pages.end() && it->is_object()) {
                merge_data(data, *it);
            }
        }
    }

    std::string DataResolver::infer_title(const SourceEntry& document) const {
        if (is_index(document.relative)) {
            auto parent = document.relative.parent_path().filename().string();
            if (!parent.empty()) return humanize(parent);
        }
        return humanize(document.relative.stem().string());
    }

}
