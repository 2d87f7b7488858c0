#include "front_matter.hpp"
#include "errors.hpp"

namespace verso::engine {

    namespace {

        std::string trimmed(const std::string& line) {
            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos) return {};
            auto last = line.find_last_not_of(" \t\r");
            return line.substr(first, last - first + 1);
        }

    }

    FrontMatter split_front_matter(const std::string& text, const std::filesystem::path& document) {
        FrontMatter result;
        const bool html = document.extension() == ".html";
        const std::string start = html ? "<!--" : "+++";
        const std::string end = html ? "-->" : "+++";

        auto first_end = text.find('\n');
        auto first_line = text.substr(0, first_end);
        if (trimmed(first_line) != start) {
            result.body = text;
            return result;
        }

        std::string block;
        std::string padding = "\n";
        size_t pos = first_end == std::string::npos ? text.size() : first_end + 1;
        bool closed = false;

        while (pos < text.size()) {
            auto eol = text.find('\n', pos);
            auto line = text.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
            pos = eol == std::string::npos ? text.size() : eol + 1;
            padding += '\n';
            if (trimmed(line) == end) {
                closed = true;
                break;
            }
            block += line;
            block += '\n';
        }

        if (!closed) {
            throw ConfigError(document, "front matter is not terminated");
        }

        try {
            if (block.find_first_not_of(" \t\r\n") != std::string::npos) {
                result.data = nlohmann::json::parse(block);
            }
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(document, std::string("malformed front matter: ") + e.what());
        }
        if (!result.data.is_object()) {
            throw ConfigError(document, "front matter must be a JSON object");
        }

        result.present = true;
        result.body = padding + text.substr(pos);
        return result;
    }

}
