#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "job_queue.hpp"

namespace verso::engine {

    inline constexpr const char* kScriptFile = "__livereload.js";
    inline constexpr const char* kScriptPath = "/__livereload.js";
    inline constexpr const char* kEventsPath = "/__verso/events";
    inline constexpr const char* kHistoryParam = "history";

    /**
     * @brief Build lifecycle message pushed to browsers.
     *
     * Wire format, one JSON object per event:
     *   {"type":"start"}
     *   {"type":"notify","message":"...","error":false}
     *   {"type":"reload"} or {"type":"reload","href":"/x/"}
     */
    struct ReloadEvent {
        enum class Type { Start, Notify, Reload };

        Type type = Type::Start;
        std::string message;
        bool error = false;
        std::optional<std::string> href;

        static ReloadEvent start();
        static ReloadEvent notify(std::string message, bool error);
        static ReloadEvent reload(std::optional<std::string> href = std::nullopt);

        const char* name() const;
        nlohmann::json to_json() const;

        /**
         * @throws std::invalid_argument if `j` is not a valid event.
         */
        static ReloadEvent from_json(const nlohmann::json& j);
    };

    using ReloadChannel = JobQueue<ReloadEvent>;

    /**
     * @brief Fans events out to the currently connected clients.
     *
     * Delivery is at most once: a client that is not subscribed when an event
     * is broadcast never sees it. Nothing is queued for absent clients.
     */
    class ReloadCoordinator {
    public:
        std::shared_ptr<ReloadChannel> subscribe();
        void unsubscribe(const std::shared_ptr<ReloadChannel>& channel);

        /**
         * @return Number of clients the event was delivered to.
         */
        size_t broadcast(const ReloadEvent& event);

        size_t client_count() const;

        /**
         * @brief Stops every channel so that open streams finish.
         */
        void close_all();

    private:
        mutable std::mutex m_mutex;
        std::vector<std::shared_ptr<ReloadChannel>> m_channels;
    };

    /**
     * @brief The browser side of the protocol, mirrored in C++.
     *
     * Tracks what the injected script does with each event so the protocol
     * can be exercised without a browser.
     */
    class ReloadClient {
    public:
        enum class State { Idle, Building, IdleWithError, Reloaded };

        explicit ReloadClient(std::string location);

        void handle(const ReloadEvent& event);

        State state() const { return m_state; }
        const std::string& message() const { return m_message; }
        bool connected() const { return m_connected; }
        int reloads() const { return m_reloads; }
        const std::string& location() const { return m_location; }

        /**
         * @brief Location the page reports to its embedding window on load,
         * or nothing when the load came from a history replay.
         */
        std::optional<std::string> announcement() const;

    private:
        std::string m_location;
        State m_state = State::Idle;
        std::string m_message;
        bool m_connected = true;
        int m_reloads = 0;
    };

    const char* to_string(ReloadClient::State state);

    /**
     * @brief Adds the history marker to a URL so the reloaded page does not
     * push a new entry into the embedding window's history.
     */
    std::string mark_history_replay(const std::string& href);
    bool is_history_replay(const std::string& href);

    /**
     * @brief Client script served as __livereload.js.
     */
    std::string livereload_script();

    /**
     * @brief The <script> tag injected into rendered pages in live mode.
     */
    std::string livereload_tag();

}
