#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace verso::engine {

    /**
     * @brief Base class for errors raised while building one document or subtree.
     *
     * Subclasses of BuildError are subtree-fatal: the pipeline records them
     * against the offending path and keeps going. FatalError aborts the pass.
     */
    class BuildError : public std::runtime_error {
    public:
        BuildError(const std::filesystem::path& path, const std::string& message)
            : std::runtime_error(message), m_path(path) {}

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    // Malformed fragment, reserved key, bad site config
    class ConfigError : public BuildError {
    public:
        using BuildError::BuildError;
    };

    // Missing layout, non-template layout, cyclic chain
    class LayoutError : public BuildError {
    public:
        using BuildError::BuildError;
    };

    // Template or Markdown failure, file name collision, write failure
    class RenderError : public BuildError {
    public:
        using BuildError::BuildError;
    };

    // External book compiler failure, reported against the book root
    class BookError : public BuildError {
    public:
        using BuildError::BuildError;
    };

    class FatalError : public BuildError {
    public:
        using BuildError::BuildError;
    };

    class ManifestError : public FatalError {
    public:
        using FatalError::FatalError;
    };

}
