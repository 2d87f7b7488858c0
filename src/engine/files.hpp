#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace verso::engine::files {

    /**
     * @brief Reads a whole file.
     * @throws std::ios_base::failure if the file cannot be opened.
     */
    std::string read(const std::filesystem::path& path);

    /**
     * @brief Writes a file, creating parent directories as needed.
     * @throws std::ios_base::failure on failure.
     */
    void write(const std::filesystem::path& path, std::string_view content);

    /**
     * @brief Copies one file, creating parent directories and overwriting the target.
     * @throws std::filesystem::filesystem_error on failure.
     */
    void copy(const std::filesystem::path& from, const std::filesystem::path& to);

    /**
     * @brief Copies every regular file below `from` into `to`, merging with existing content.
     * @return Copied paths relative to `to`.
     */
    std::vector<std::filesystem::path> copy_tree(const std::filesystem::path& from, const std::filesystem::path& to);

}
