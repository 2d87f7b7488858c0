#include "redirect.hpp"
#include "errors.hpp"
#include <algorithm>

namespace verso::engine {

    namespace {

        const std::filesystem::path kSiteConfig = "site.json";

        std::string without_trailing_slash(std::string url) {
            while (url.size() > 1 && url.back() == '/') url.pop_back();
            return url;
        }

        std::string escape_attribute(const std::string& text) {
            std::string out;
            out.reserve(text.size());
            for (char c : text) {
                switch (c) {
                    case '&': out += "&amp;"; break;
                    case '<': out += "&lt;"; break;
                    case '>': out += "&gt;"; break;
                    case '"': out += "&quot;"; break;
                    case '\'': out += "&#39;"; break;
                    default: out += c;
                }
            }
            return out;
        }

        void follow(const std::string& from, const std::string& to,
                    const std::map<std::string, std::string>& table, std::vector<std::string>& chain) {
            if (chain.size() >= kMaxRedirectHops) {
                throw ConfigError(kSiteConfig, "too many redirects from '" + chain.front() + "', limit is " +
                                               std::to_string(kMaxRedirectHops));
            }

            auto key = without_trailing_slash(from);
            if (std::find(chain.begin(), chain.end(), key) != chain.end()) {
                std::string cycle;
                for (const auto& step : chain) cycle += step + " -> ";
                throw ConfigError(kSiteConfig, "cyclic redirect: " + cycle + key);
            }
            chain.push_back(key);

            auto bare = without_trailing_slash(to);
            for (const auto& candidate : {to, bare, bare + "/"}) {
                auto it = table.find(candidate);
                if (it != table.end()) {
                    follow(it->first, it->second, table, chain);
                    return;
                }
            }
        }

    }

    std::filesystem::path redirect_destination(const std::string& from) {
        if (from.empty()) {
            throw ConfigError(kSiteConfig, "empty redirect URL");
        }

        auto trimmed = from.substr(from.find_first_not_of('/') == std::string::npos ? from.size()
                                                                                    : from.find_first_not_of('/'));
        std::filesystem::path relative(trimmed);
        for (const auto& part : relative) {
            if (part == "..") {
                throw ConfigError(kSiteConfig, "redirect URL '" + from + "' leaves the site");
            }
        }

        if (trimmed.empty() || trimmed.back() == '/' || !relative.has_extension()) {
            return (relative / "index.html").lexically_normal();
        }
        return relative.lexically_normal();
    }

    std::string redirect_page(const std::string& location) {
        auto escaped = escape_attribute(location);
        return "<!doctype html><html><head>"
               "<meta charset=\"utf-8\">"
               "<noscript><meta http-equiv=\"refresh\" content=\"0; url=" + escaped + "\"></noscript>"
               "<link rel=\"canonical\" href=\"" + escaped + "\">"
               "</head><body onload=\"document.location.replace(document.body.dataset.to);\" data-to=\"" + escaped + "\">"
               "<a href=\"" + escaped + "\">" + escaped + "</a>"
               "</body></html>\n";
    }

    std::vector<Redirect> plan_redirects(const std::map<std::string, std::string>& table) {
        std::vector<Redirect> planned;
        for (const auto& [from, to] : table) {
            if (to.empty()) {
                throw ConfigError(kSiteConfig, "redirect '" + from + "' has no location");
            }
            std::vector<std::string> chain;
            follow(from, to, table, chain);
            planned.push_back({from, to, redirect_destination(from)});
        }
        return planned;
    }

}
