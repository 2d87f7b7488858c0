#include "scanner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

namespace verso::engine {

    Scanner::Scanner(const Config& config) : m_config(config) {
        m_ignore.add_defaults();
        for (const auto& pattern : config.ignore) {
            m_ignore.add(pattern);
        }
    }

    ScanResult Scanner::scan(const std::filesystem::path& root) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw FatalError(root, "source root is not a readable directory");
        }

        ScanResult result;
        m_ignore.load(root / kIgnoreFile);

        if (std::filesystem::exists(root / kBookMarker)) {
            result.books.push_back({"", kBookMarker});
            return result;
        }

        // The build directory may live inside the source tree
        auto build = std::filesystem::weakly_canonical(m_config.build, ec);

        auto it = std::filesystem::recursive_directory_iterator(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw FatalError(root, "cannot read source root: " + ec.message());
        }

        for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "[Scanner] " << ec.message() << "\n";
                ec.clear();
                continue;
            }

            const auto& path = it->path();
            auto relative = path.lexically_relative(root);
            bool is_dir = it->is_directory(ec);

            if (m_ignore.check(relative, is_dir)) {
                if (is_dir) it.disable_recursion_pending();
                continue;
            }

            if (is_dir) {
                if (!build.empty() && std::filesystem::weakly_canonical(path, ec) == build) {
                    it.disable_recursion_pending();
                    continue;
                }
                if (std::filesystem::exists(path / kBookMarker)) {
                    result.books.push_back({relative, relative / kBookMarker});
                    it.disable_recursion_pending();
                    continue;
                }
                m_ignore.load(path / kIgnoreFile, relative);
                continue;
            }

            if (it->is_regular_file(ec)) {
                SourceEntry entry;
                entry.path = path;
                entry.relative = relative;
                entry.last_write_time = it->last_write_time(ec);
                result.entries.push_back(std::move(entry));
            }
        }

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const SourceEntry& a, const SourceEntry& b) { return a.relative < b.relative; });
        return result;
    }

}
