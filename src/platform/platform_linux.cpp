#include "../platform.hpp"
#include <iostream>
#include <sys/inotify.h>
#include <sys/wait.h>
#include <unistd.h>
#include <poll.h>
#include <map>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>

namespace verso::platform {

    class LinuxSentry : public Sentry {
    public:
        LinuxSentry() {
            m_fd = inotify_init1(IN_NONBLOCK);
            if (m_fd < 0) {
                std::cerr << "[LinuxSentry] Failed to initialize inotify: " << std::strerror(errno) << "\n";
            }
        }

        ~LinuxSentry() {
            stop();
            if (m_fd >= 0) close(m_fd);
        }

        void add_watch(const std::filesystem::path& path) override {
            if (m_fd < 0) return;

            if (!std::filesystem::is_directory(path)) {
                std::cerr << "[LinuxSentry] Not a directory: " << path << "\n";
                return;
            }
            add_tree(path);
        }

        void set_callback(EventCallback callback) override {
            m_callback = callback;
        }

        void start() override {
            if (m_fd < 0) return;
            m_running = true;
            std::cout << "[LinuxSentry] Starting watcher loop...\n";

            struct pollfd pfd = { m_fd, POLLIN, 0 };
            char buffer[4096] __attribute__ ((aligned(__alignof__(struct inotify_event))));

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500); // 500ms timeout
                if (poll_num <= 0 || !(pfd.revents & POLLIN)) continue;

                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len < 0) {
                    if (errno != EAGAIN) std::cerr << "[LinuxSentry] read error: " << std::strerror(errno) << "\n";
                    continue;
                }

                const struct inotify_event *event;
                for (char *ptr = buffer; ptr < buffer + len; ptr += sizeof(struct inotify_event) + event->len) {
                    event = (const struct inotify_event *) ptr;
                    handle_event(event);
                }
            }
        }

        void stop() override {
            m_running = false;
        }

    private:
        int m_fd = -1;
        std::atomic<bool> m_running{false};
        std::map<int, std::filesystem::path> m_watches; // wd -> path
        EventCallback m_callback;

        void add_tree(const std::filesystem::path& root) {
            add_watch_single(root);
            std::error_code ec;
            for (auto it = std::filesystem::recursive_directory_iterator(
                     root, std::filesystem::directory_options::skip_permission_denied, ec);
                 !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_directory()) add_watch_single(it->path());
            }
        }

        void add_watch_single(const std::filesystem::path& path) {
            int wd = inotify_add_watch(m_fd, path.c_str(),
                                       IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO);
            if (wd >= 0) {
                m_watches[wd] = path;
            } else {
                std::cerr << "[LinuxSentry] Failed to watch " << path << ": " << std::strerror(errno) << "\n";
            }
        }

        void handle_event(const struct inotify_event* event) {
            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[LinuxSentry] Event queue overflow.\n";
                return;
            }

            auto it = m_watches.find(event->wd);
            if (it == m_watches.end()) return;

            std::filesystem::path full_path = it->second;
            if (event->len > 0) full_path /= event->name;

            // New or moved-in directories need their own watches
            if ((event->mask & (IN_CREATE | IN_MOVED_TO)) && (event->mask & IN_ISDIR)) {
                add_tree(full_path);
            }

            if (!m_callback) return;

            FileEvent fe;
            fe.path = full_path;

            if (event->mask & (IN_CREATE | IN_MOVED_TO)) fe.type = FileEvent::Type::Created;
            else if (event->mask & IN_DELETE) fe.type = FileEvent::Type::Deleted;
            else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) fe.type = FileEvent::Type::Modified;
            else if (event->mask & IN_MOVED_FROM) fe.type = FileEvent::Type::Renamed;
            else return;

            m_callback(fe);
        }
    };

    std::unique_ptr<Sentry> Sentry::create() {
        return std::make_unique<LinuxSentry>();
    }

    ProcessResult run_process(const std::vector<std::string>& args,
                              const std::vector<std::pair<std::string, std::string>>& env) {
        ProcessResult result;
        if (args.empty()) {
            result.output = "No program given";
            return result;
        }

        int output_pipe[2];
        if (pipe(output_pipe) != 0) {
            result.output = "Failed to create pipe";
            return result;
        }

        pid_t pid = fork();
        if (pid < 0) {
            result.output = "Failed to fork";
            close(output_pipe[0]);
            close(output_pipe[1]);
            return result;
        }

        if (pid == 0) {
            // Child process
            close(output_pipe[0]);
            dup2(output_pipe[1], STDOUT_FILENO);
            dup2(output_pipe[1], STDERR_FILENO);
            close(output_pipe[1]);

            for (const auto& [key, value] : env) {
                setenv(key.c_str(), value.c_str(), 1);
            }

            std::vector<char*> c_args;
            for (const auto& a : args) {
                c_args.push_back(const_cast<char*>(a.c_str()));
            }
            c_args.push_back(nullptr);

            execvp(c_args[0], c_args.data());
            _exit(127);
        }

        close(output_pipe[1]);

        // Drain until EOF so a chatty child never blocks on a full pipe
        char buffer[4096];
        while (true) {
            ssize_t n = read(output_pipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        close(output_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                result.output += "\nwaitpid failed: ";
                result.output += std::strerror(errno);
                return result;
            }
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            // execvp failure in the child
            result.launched = result.exit_code != 127;
        } else {
            result.launched = true;
            result.exit_code = -1;
        }
        return result;
    }

}
