#include "manifest.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "verso/sha256.h"
#include <iostream>

namespace verso::engine {

    BuildManifest::BuildManifest(const Config& config)
        : m_config(config), m_file(config.manifest_file()) {}

    void BuildManifest::load() {
        m_entries.clear();
        m_warnings.clear();

        if (!std::filesystem::exists(m_file)) return;

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(files::read(m_file));
        } catch (const nlohmann::json::parse_error& e) {
            throw ManifestError(m_file, std::string("corrupt manifest: ") + e.what());
        } catch (const std::ios_base::failure& e) {
            throw ManifestError(m_file, e.what());
        }

        if (!j.is_object()) {
            throw ManifestError(m_file, "corrupt manifest: root is not an object");
        }

        if (!j.contains("version") || !j["version"].is_number_integer()) {
            throw ManifestError(m_file, "corrupt manifest: 'version' is not an integer");
        }
        if (j["version"].get<std::int64_t>() != kVersion) {
            m_warnings.push_back("manifest version mismatch, rebuilding everything");
            std::cerr << "[Manifest] Version mismatch in " << m_file << ", discarding.\n";
            return;
        }

        if (!j.contains("entries")) return;
        if (!j["entries"].is_object()) {
            throw ManifestError(m_file, "corrupt manifest: 'entries' is not an object");
        }

        for (const auto& item : j["entries"].items()) {
            if (!read_entry(item.key(), item.value())) {
                m_warnings.push_back("dropping malformed manifest entry: " + item.key());
            }
        }
    }

    bool BuildManifest::read_entry(const std::string& key, const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("modified") || !j["modified"].is_number_integer() ||
            !j.contains("output") || !j["output"].is_string()) {
            return false;
        }

        ManifestEntry entry;
        entry.source = key;
        entry.modified = j["modified"].get<std::int64_t>();
        entry.destination = j["output"].get<std::string>();
        if (j.contains("digest") && j["digest"].is_string()) {
            entry.digest = j["digest"].get<std::string>();
        }
        if (j.contains("partials") && j["partials"].is_string()) {
            entry.partials = j["partials"].get<std::string>();
        }
        if (j.contains("dependencies")) {
            if (!j["dependencies"].is_array()) return false;
            for (const auto& dep : j["dependencies"]) {
                if (!dep.is_object() || !dep.contains("path") || !dep["path"].is_string() ||
                    !dep.contains("modified") || !dep["modified"].is_number_integer()) {
                    return false;
                }
                entry.dependencies.push_back({dep["path"].get<std::string>(), dep["modified"].get<std::int64_t>()});
            }
        }
        m_entries[key] = std::move(entry);
        return true;
    }

    nlohmann::json BuildManifest::to_json() const {
        nlohmann::json entries = nlohmann::json::object();
        for (const auto& [key, entry] : m_entries) {
            nlohmann::json e;
            e["modified"] = entry.modified;
            e["output"] = entry.destination.generic_string();
            if (!entry.digest.empty()) e["digest"] = entry.digest;
            if (!entry.partials.empty()) e["partials"] = entry.partials;
            if (!entry.dependencies.empty()) {
                auto deps = nlohmann::json::array();
                for (const auto& dep : entry.dependencies) {
                    deps.push_back({{"path", dep.path.generic_string()}, {"modified", dep.modified}});
                }
                e["dependencies"] = std::move(deps);
            }
            entries[key] = std::move(e);
        }

        return {
            {"version", kVersion},
            {"tag", m_config.tag},
            {"entries", std::move(entries)}
        };
    }

    void BuildManifest::save() const {
        auto temp = m_file;
        temp += ".tmp";
        try {
            files::write(temp, to_json().dump(2));
            std::filesystem::rename(temp, m_file);
        } catch (const std::ios_base::failure& e) {
            throw ManifestError(m_file, std::string("cannot write manifest: ") + e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            throw ManifestError(m_file, std::string("cannot write manifest: ") + e.what());
        }
    }

    bool BuildManifest::is_stale(const SourceEntry& entry, const std::filesystem::path& destination,
                                 const std::vector<Dependency>& dependencies) const {
        if (m_config.force || !m_config.incremental) return true;

        auto it = m_entries.find(entry.relative.generic_string());
        if (it == m_entries.end()) return true;
        const auto& recorded = it->second;

        if (recorded.destination != destination) return true;
        if (!std::filesystem::exists(m_config.target() / destination)) return true;
        if (recorded.modified != to_ticks(entry.last_write_time)) {
            // Touched but unchanged content is still fresh in digest mode
            if (!m_config.digest || recorded.digest.empty() || entry.kind == SourceKind::Book) return true;
            if (crypto::SHA256::hash_file(entry.path.string()) != recorded.digest) return true;
        }
        if (recorded.dependencies != dependencies) return true;
        if (entry.kind == SourceKind::Document && recorded.partials != m_partials) return true;

        return false;
    }

    ManifestEntry BuildManifest::make_entry(const SourceEntry& entry, const std::filesystem::path& destination,
                                            std::vector<Dependency> dependencies) const {
        ManifestEntry result;
        result.source = entry.relative;
        result.modified = to_ticks(entry.last_write_time);
        result.destination = destination;
        result.dependencies = std::move(dependencies);
        if (m_config.digest && entry.kind != SourceKind::Book && std::filesystem::is_regular_file(entry.path)) {
            result.digest = crypto::SHA256::hash_file(entry.path.string());
        }
        if (entry.kind == SourceKind::Document) result.partials = m_partials;
        return result;
    }

    void BuildManifest::record(ManifestEntry entry) {
        auto key = entry.source.generic_string();
        m_entries[key] = std::move(entry);
    }

    bool BuildManifest::forget(const std::filesystem::path& source) {
        return m_entries.erase(source.generic_string()) > 0;
    }

    std::vector<ManifestEntry> BuildManifest::prune(const std::set<std::string>& live) {
        std::vector<ManifestEntry> removed;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (live.count(it->first) == 0) {
                removed.push_back(std::move(it->second));
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    const ManifestEntry* BuildManifest::find(const std::filesystem::path& source) const {
        auto it = m_entries.find(source.generic_string());
        return it == m_entries.end() ? nullptr : &it->second;
    }

}
