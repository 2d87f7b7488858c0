#include "partials.hpp"
#include "classifier.hpp"
#include "files.hpp"
#include "verso/sha256.h"
#include <algorithm>
#include <vector>

namespace verso::engine {

    PartialSet PartialSet::load(const std::filesystem::path& dir) {
        PartialSet set;
        if (!std::filesystem::is_directory(dir)) return set;

        std::vector<std::filesystem::path> paths;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
            if (!entry.is_regular_file()) continue;
            auto ext = entry.path().extension().string();
            if (std::find(kTemplateExtensions.begin(), kTemplateExtensions.end(), ext) == kTemplateExtensions.end()) {
                continue;
            }
            if (entry.path().filename().string().front() == '.') continue;
            paths.push_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());

        for (const auto& path : paths) {
            auto ext = path.extension().string();
            auto relative = path.lexically_relative(dir);
            auto content = files::read(path);

            auto bare = relative;
            bare.replace_extension();
            // "nav.html" wins the bare name over "nav.json"
            if (set.m_templates.count(bare.generic_string()) == 0 || ext != kDataExtension) {
                set.add(bare.generic_string(), content);
            }
            set.add(relative.generic_string(), std::move(content));
        }
        return set;
    }

    void PartialSet::add(const std::string& name, std::string content) {
        m_templates[name] = std::move(content);
    }

    std::string PartialSet::signature() const {
        crypto::SHA256 sha;
        for (const auto& [name, content] : m_templates) {
            sha.update(name);
            sha.update("\0", 1);
            sha.update(content);
            sha.update("\0", 1);
        }
        return sha.final();
    }

}
