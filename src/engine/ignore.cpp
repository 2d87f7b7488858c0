#include "ignore.hpp"
#include <fstream>
#include <iostream>

namespace verso::engine {

    namespace {

        // Returns the part of `path` below `base`, or an empty path if `path` is not inside it.
        std::filesystem::path below(const std::filesystem::path& path, const std::filesystem::path& base) {
            if (base.empty()) return path;
            auto it = path.begin();
            for (const auto& part : base) {
                if (it == path.end() || *it != part) return {};
                ++it;
            }
            std::filesystem::path rest;
            for (; it != path.end(); ++it) rest /= *it;
            return rest;
        }

    }

    void Ignore::load(const std::filesystem::path& ignore_file, const std::filesystem::path& base) {
        if (!std::filesystem::exists(ignore_file)) return;

        std::ifstream file(ignore_file);
        if (!file) {
            std::cerr << "[Ignore] Cannot read " << ignore_file << "\n";
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line, base);
        }
    }

    void Ignore::add(const std::string& pattern, const std::filesystem::path& base) {
        Pattern p;
        p.original = pattern;
        p.base = base;

        std::string glob = pattern;
        if (!glob.empty() && glob[0] == '!') {
            p.negated = true;
            glob.erase(0, 1);
        }
        if (!glob.empty() && glob.back() == '/') {
            p.dir_only = true;
            glob.pop_back();
        }
        if (!glob.empty() && glob[0] == '/') {
            p.anchored = true;
            glob.erase(0, 1);
        }
        if (glob.find('/') != std::string::npos) p.anchored = true;
        if (glob.empty()) return;

        p.regex = std::regex(glob_to_regex(glob));
        m_patterns.push_back(std::move(p));
    }

    void Ignore::add_defaults() {
        std::vector<std::string> defaults = {
            ".git/", ".svn/", ".hg/",
            "node_modules/",
            "*~", "*.swp", "*.swx", "#*#",
            ".DS_Store", "Thumbs.db"
        };
        for (const auto& p : defaults) {
            add(p);
        }
    }

    bool Ignore::check(const std::filesystem::path& relative, bool is_dir) const {
        std::string filename = relative.filename().string();
        bool ignored = !filename.empty() && filename[0] == '.' && filename != "." && filename != "..";

        for (const auto& p : m_patterns) {
            if (p.dir_only && !is_dir) continue;

            auto sub = below(relative, p.base);
            if (sub.empty()) continue;

            const std::string subject = p.anchored ? sub.generic_string() : filename;
            if (std::regex_match(subject, p.regex)) {
                ignored = !p.negated;
            }
        }
        return ignored;
    }

    bool Ignore::excludes(const std::filesystem::path& relative) const {
        if (relative.empty()) return false;

        std::filesystem::path prefix;
        auto last = std::prev(relative.end());
        for (auto it = relative.begin(); it != relative.end(); ++it) {
            prefix /= *it;
            if (it == last) break;
            if (check(prefix, true)) return true;
        }
        return check(relative, false);
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (size_t i = 0; i < glob.size(); ++i) {
            char c = glob[i];
            if (c == '*') {
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    ++i;
                    // "**/" matches zero or more whole directories
                    if (i + 1 < glob.size() && glob[i + 1] == '/') {
                        regex_str += "(?:.*/)?";
                        ++i;
                    } else {
                        regex_str += ".*";
                    }
                } else {
                    regex_str += "[^/]*";
                }
            } else if (c == '?') {
                regex_str += "[^/]";
            } else if (std::string(".+()[]{}^$|\\").find(c) != std::string::npos) {
                regex_str += '\\';
                regex_str += c;
            } else {
                regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
