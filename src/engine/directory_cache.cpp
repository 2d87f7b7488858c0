#include "directory_cache.hpp"
#include "classifier.hpp"
#include "files.hpp"

namespace verso::engine {

    namespace {

        const char* const kReservedKeys[] = {"context", "template"};
        const char* const kPagesKey = "pages";
        const char* const kInheritKey = "inherit";

        std::int64_t modified(const std::filesystem::path& path) {
            std::error_code ec;
            auto time = std::filesystem::last_write_time(path, ec);
            return ec ? 0 : to_ticks(time);
        }

    }

    std::filesystem::path DirectoryInfo::fragment_path() const {
        return dir / kDataFile;
    }

    std::vector<std::filesystem::path> ancestor_dirs(const std::filesystem::path& dir) {
        std::vector<std::filesystem::path> dirs;
        std::filesystem::path current;
        dirs.push_back(current);
        for (const auto& part : dir) {
            if (part.empty() || part == ".") continue;
            current /= part;
            dirs.push_back(current);
        }
        return dirs;
    }

    std::optional<std::string> find_reserved_key(const nlohmann::json& fragment) {
        if (!fragment.is_object()) return std::nullopt;
        for (const char* key : kReservedKeys) {
            if (fragment.contains(key)) {
                return std::string("reserved key '") + key + "' cannot be set in configuration data";
            }
        }
        return std::nullopt;
    }

    DirectoryCache::DirectoryCache(const Config& config, const std::filesystem::path& root, const Ignore& ignore)
        : m_config(config), m_root(root), m_ignore(ignore) {}

    std::shared_ptr<const DirectoryInfo> DirectoryCache::get(const std::filesystem::path& dir) {
        const std::string key = dir.generic_string();
        std::promise<std::shared_ptr<const DirectoryInfo>> promise;
        Slot slot;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_slots.find(key);
            if (it != m_slots.end()) {
                slot = it->second;
            } else {
                slot = promise.get_future().share();
                m_slots.emplace(key, slot);
                owner = true;
            }
        }

        if (owner) {
            // Waiters must not block forever if loading throws
            try {
                promise.set_value(load(dir));
            } catch (...) {
                promise.set_exception(std::current_exception());
                throw;
            }
        }
        return slot.get();
    }

    std::shared_ptr<const DirectoryInfo> DirectoryCache::load(const std::filesystem::path& dir) {
        ++m_loads;
        auto info = std::make_shared<DirectoryInfo>();
        info->dir = dir;

        auto fragment = m_root / dir / kDataFile;
        if (!m_ignore.excludes(dir / kDataFile) && std::filesystem::is_regular_file(fragment)) {
            info->has_fragment = true;
            info->fragment_modified = modified(fragment);
            try {
                auto j = nlohmann::json::parse(files::read(fragment));
                if (!j.is_object()) {
                    info->error = "configuration fragment must be a JSON object";
                } else {
                    if (j.contains(kPagesKey)) {
                        if (!j[kPagesKey].is_object()) {
                            info->error = "'pages' must be a table of per-document tables";
                        } else {
                            info->pages = j[kPagesKey];
                        }
                        j.erase(kPagesKey);
                    }
                    info->data = std::move(j);
                    if (auto reserved = find_reserved_key(info->data)) {
                        info->error = *reserved;
                    }
                    for (const auto& page : info->pages.items()) {
                        if (auto reserved = find_reserved_key(page.value())) {
                            info->error = *reserved + " (pages." + page.key() + ")";
                        }
                    }
                }
            } catch (const nlohmann::json::parse_error& e) {
                info->error = std::string("malformed configuration fragment: ") + e.what();
            } catch (const std::ios_base::failure& e) {
                info->error = std::string("cannot read configuration fragment: ") + e.what();
            }
        }

        auto layout = m_root / dir / m_config.layout;
        if (!m_ignore.excludes(dir / m_config.layout) && std::filesystem::is_regular_file(layout)) {
            info->layout = dir / m_config.layout;
            info->layout_modified = modified(layout);

            auto options_name = std::filesystem::path(m_config.layout).stem().string() + kDataExtension;
            auto options = m_root / dir / options_name;
            if (!m_ignore.excludes(dir / options_name) && std::filesystem::is_regular_file(options)) {
                info->options_file = dir / options_name;
                info->options_modified = modified(options);
                try {
                    auto j = nlohmann::json::parse(files::read(options));
                    if (!j.is_object()) {
                        info->layout_error = "layout options must be a JSON object";
                    } else {
                        for (const auto& item : j.items()) {
                            if (item.key() != kInheritKey) {
                                info->layout_warnings.push_back("unknown layout option '" + item.key() + "' in " +
                                                                info->options_file->generic_string());
                            }
                        }
                        if (j.contains(kInheritKey)) {
                            if (j[kInheritKey].is_boolean()) {
                                info->inherit = j[kInheritKey].get<bool>();
                            } else {
                                info->layout_warnings.push_back("ignoring non-boolean 'inherit' in " +
                                                                info->options_file->generic_string());
                            }
                        }
                    }
                } catch (const nlohmann::json::parse_error& e) {
                    info->layout_error = std::string("malformed layout options: ") + e.what();
                } catch (const std::ios_base::failure& e) {
                    info->layout_error = std::string("cannot read layout options: ") + e.what();
                }
            }
        }

        return info;
    }

}
