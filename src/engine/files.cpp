#include "files.hpp"
#include <fstream>
#include <iterator>

namespace verso::engine::files {

    std::string read(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            throw std::ios_base::failure("could not read file: " + path.string());
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void write(const std::filesystem::path& path, std::string_view content) {
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::ios_base::failure("could not create directory " + path.parent_path().string() + ": " +
                                             ec.message());
            }
        }
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::ios_base::failure("could not write file: " + path.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw std::ios_base::failure("short write: " + path.string());
        }
    }

    void copy(const std::filesystem::path& from, const std::filesystem::path& to) {
        if (to.has_parent_path()) {
            std::filesystem::create_directories(to.parent_path());
        }
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
    }

    std::vector<std::filesystem::path> copy_tree(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::vector<std::filesystem::path> copied;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(from)) {
            if (!entry.is_regular_file()) continue;
            auto relative = entry.path().lexically_relative(from);
            files::copy(entry.path(), to / relative);
            copied.push_back(relative);
        }
        return copied;
    }

}
