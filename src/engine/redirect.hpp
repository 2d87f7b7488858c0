#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace verso::engine {

    inline constexpr size_t kMaxRedirectHops = 4;
    inline constexpr const char* kRedirectKeyPrefix = "redirect:";

    struct Redirect {
        std::string from;                  // Site URL, e.g. "/old/"
        std::string to;                    // Location sent to the browser
        std::filesystem::path destination; // Page written for `from`, relative to the destination root
    };

    /**
     * @brief "/old/" -> old/index.html, "/old" -> old/index.html, "/old.html" -> old.html.
     * @throws ConfigError if the URL is empty or leaves the destination root.
     */
    std::filesystem::path redirect_destination(const std::string& from);

    /**
     * @brief Static page that sends the browser to `location`.
     */
    std::string redirect_page(const std::string& location);

    /**
     * @brief Validates the site redirect table and plans one page per entry.
     *
     * A redirect may point at another redirect, up to kMaxRedirectHops in a
     * row. Trailing slashes are ignored when following a chain.
     * @throws ConfigError on a cycle or a chain that is too long.
     */
    std::vector<Redirect> plan_redirects(const std::map<std::string, std::string>& table);

}
