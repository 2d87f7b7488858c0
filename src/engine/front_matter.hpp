#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace verso::engine {

    /**
     * @brief A document split into its front matter and its body.
     *
     * Front matter is a JSON object at the very top of a document, between
     * delimiter lines: "+++" and "+++" in Markdown, "<!--" and "-->" in HTML.
     * The delimiters must be alone on their line. Front matter lines are
     * replaced by empty lines in `body` so template errors keep their line numbers.
     */
    struct FrontMatter {
        bool present = false;
        nlohmann::json data = nlohmann::json::object();
        std::string body;
    };

    /**
     * @brief Splits a document's text.
     * @param document Relative path, selects the delimiters and names errors.
     * @throws ConfigError if the block is unterminated, malformed or not an object.
     */
    FrontMatter split_front_matter(const std::string& text, const std::filesystem::path& document);

}
