#include "reload.hpp"
#include <algorithm>
#include <stdexcept>

namespace verso::engine {

    ReloadEvent ReloadEvent::start() {
        return ReloadEvent{};
    }

    ReloadEvent ReloadEvent::notify(std::string message, bool error) {
        ReloadEvent e;
        e.type = Type::Notify;
        e.message = std::move(message);
        e.error = error;
        return e;
    }

    ReloadEvent ReloadEvent::reload(std::optional<std::string> href) {
        ReloadEvent e;
        e.type = Type::Reload;
        e.href = std::move(href);
        return e;
    }

    const char* ReloadEvent::name() const {
        switch (type) {
            case Type::Start: return "start";
            case Type::Notify: return "notify";
            case Type::Reload: return "reload";
        }
        return "start";
    }

    nlohmann::json ReloadEvent::to_json() const {
        nlohmann::json j = {{"type", name()}};
        if (type == Type::Notify) {
            j["message"] = message;
            j["error"] = error;
        } else if (type == Type::Reload && href) {
            j["href"] = *href;
        }
        return j;
    }

    ReloadEvent ReloadEvent::from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            throw std::invalid_argument("reload event without a type");
        }
        auto type = j["type"].get<std::string>();
        if (type == "start") return start();
        if (type == "notify") {
            return notify(j.value("message", std::string()), j.value("error", false));
        }
        if (type == "reload") {
            if (j.contains("href") && j["href"].is_string()) return reload(j["href"].get<std::string>());
            return reload();
        }
        throw std::invalid_argument("unknown reload event type: " + type);
    }

    std::shared_ptr<ReloadChannel> ReloadCoordinator::subscribe() {
        auto channel = std::make_shared<ReloadChannel>();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channels.push_back(channel);
        return channel;
    }

    void ReloadCoordinator::unsubscribe(const std::shared_ptr<ReloadChannel>& channel) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channels.erase(std::remove(m_channels.begin(), m_channels.end(), channel), m_channels.end());
    }

    size_t ReloadCoordinator::broadcast(const ReloadEvent& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t delivered = 0;
        for (const auto& channel : m_channels) {
            if (channel->stopped()) continue;
            channel->push(event);
            ++delivered;
        }
        return delivered;
    }

    size_t ReloadCoordinator::client_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_channels.size();
    }

    void ReloadCoordinator::close_all() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& channel : m_channels) channel->stop();
        m_channels.clear();
    }

    ReloadClient::ReloadClient(std::string location) : m_location(std::move(location)) {}

    void ReloadClient::handle(const ReloadEvent& event) {
        // The script closes its own connection on reload
        if (!m_connected) return;

        switch (event.type) {
            case ReloadEvent::Type::Start:
                m_state = State::Building;
                m_message = "Building...";
                break;
            case ReloadEvent::Type::Notify:
                m_state = event.error ? State::IdleWithError : State::Idle;
                m_message = event.message;
                break;
            case ReloadEvent::Type::Reload:
                m_connected = false;
                m_state = State::Reloaded;
                ++m_reloads;
                if (event.href) m_location = *event.href;
                break;
        }
    }

    std::optional<std::string> ReloadClient::announcement() const {
        if (is_history_replay(m_location)) return std::nullopt;
        return m_location;
    }

    const char* to_string(ReloadClient::State state) {
        switch (state) {
            case ReloadClient::State::Idle: return "idle";
            case ReloadClient::State::Building: return "building";
            case ReloadClient::State::IdleWithError: return "idle-with-error";
            case ReloadClient::State::Reloaded: return "reloaded";
        }
        return "idle";
    }

    bool is_history_replay(const std::string& href) {
        auto end = href.find('#');
        auto query = href.find('?');
        if (query == std::string::npos || (end != std::string::npos && query > end)) return false;

        auto params = href.substr(query + 1, end == std::string::npos ? std::string::npos : end - query - 1);
        const std::string key = std::string(kHistoryParam) + "=";
        size_t pos = 0;
        while (pos <= params.size()) {
            auto amp = params.find('&', pos);
            auto param = params.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (param.compare(0, key.size(), key) == 0 && param.size() > key.size()) return true;
            if (amp == std::string::npos) break;
            pos = amp + 1;
        }
        return false;
    }

    std::string mark_history_replay(const std::string& href) {
        if (is_history_replay(href)) return href;

        auto fragment = href.find('#');
        auto base = href.substr(0, fragment);
        auto tail = fragment == std::string::npos ? std::string() : href.substr(fragment);

        char separator = '?';
        if (base.find('?') != std::string::npos) {
            separator = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
        }
        std::string result = base;
        if (separator) result += separator;
        result += std::string(kHistoryParam) + "=1";
        return result + tail;
    }

    std::string livereload_tag() {
        return std::string("<script src=\"") + kScriptPath + "\"></script>";
    }

    std::string livereload_script() {
        std::string script = "(function() {\n  const source = new EventSource('";
        script += kEventsPath;
        script += "');\n";
        script += R"JS(
  function banner() {
    let el = document.querySelector('.verso-livereload');
    if (!el) {
      el = document.createElement('div');
      el.className = 'verso-livereload';
      el.style.cssText = 'position:fixed;bottom:1em;right:1em;padding:.5em 1em;' +
        'background:#222;color:#fff;font:13px sans-serif;border-radius:4px;z-index:99999';
      el.appendChild(document.createElement('span'));
      document.body.appendChild(el);
    }
    return el;
  }

  source.onmessage = (event) => {
    const e = JSON.parse(event.data);
    const el = banner();
    const msg = el.querySelector('span');
    if (e.type === 'start') {
      el.style.display = 'block';
      el.style.background = '#222';
      msg.innerText = 'Building...';
    } else if (e.type === 'notify') {
      el.style.display = 'block';
      msg.innerText = e.message;
      if (e.error) {
        console.error(e.message);
        el.style.background = '#a00';
      } else {
        setTimeout(() => { el.style.display = 'none'; }, 1500);
      }
    } else if (e.type === 'reload') {
      source.close();
      if (e.href) { location.href = e.href; } else { location.reload(); }
    }
  };

  // Loads replayed from the embedding window's history carry ?history=1
  // and must not be reported back as new navigations.
  if (window.parent && window.parent !== window) {
    const replay = new URLSearchParams(window.location.search).get('history');
    if (!replay) {
      window.parent.postMessage(document.location.href, '*');
    }
  }

  window.addEventListener('beforeunload', () => source.close());
})();
)JS";
        return script;
    }

}
