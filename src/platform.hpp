#pragma once

#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <memory>
#include <filesystem>

namespace verso::platform {

    /**
     * @brief Platform-agnostic file system event types.
     */
    struct FileEvent {
        enum class Type {
            Modified,
            Created,
            Deleted,
            Renamed
        };

        std::filesystem::path path;
        Type type;
    };

    /**
     * @brief Abstract base class for the File Watcher (Sentry).
     * The Linux implementation uses inotify.
     */
    class Sentry {
    public:
        using EventCallback = std::function<void(const FileEvent&)>;

        virtual ~Sentry() = default;

        /**
         * @brief Starts watching a directory recursively.
         * @param path The root path to watch.
         */
        virtual void add_watch(const std::filesystem::path& path) = 0;

        /**
         * @brief Sets the callback for file events.
         */
        virtual void set_callback(EventCallback callback) = 0;

        /**
         * @brief Runs the watcher loop. Blocks until stop() is called.
         */
        virtual void start() = 0;

        /**
         * @brief Stops the watcher.
         */
        virtual void stop() = 0;

        /**
         * @brief Factory method to create a platform-specific Sentry.
         */
        static std::unique_ptr<Sentry> create();
    };

    struct ProcessResult {
        bool launched = false;
        int exit_code = -1;
        std::string output; // stdout and stderr, interleaved
    };

    /**
     * @brief Runs a program found on PATH and waits for it.
     * @param args Program name followed by its arguments.
     * @param env Extra environment variables for the child.
     */
    ProcessResult run_process(const std::vector<std::string>& args,
                              const std::vector<std::pair<std::string, std::string>>& env = {});

}
