#include "session/session_store.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlrag {

SessionStore::SessionStore(Config config)
    : config_(config) {}

std::shared_ptr<SessionStore::Session> SessionStore::find(const std::string& session_id) const {
    std::shared_lock lock(map_mutex_);
    const auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<SessionStore::Session> SessionStore::get_or_create(const std::string& session_id) {
    if (auto existing = find(session_id)) {
        return existing;
    }

    std::unique_lock lock(map_mutex_);
    const auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    if (sessions_.size() >= config_.max_sessions) {
        evict_oldest_locked();
    }
    auto session = std::make_shared<Session>();
    session->last_activity = std::chrono::steady_clock::now();
    sessions_.emplace(session_id, session);
    return session;
}

void SessionStore::evict_oldest_locked() {
    auto oldest = sessions_.end();
    auto oldest_time = std::chrono::steady_clock::time_point::max();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        std::lock_guard session_lock(it->second->mutex);
        if (it->second->last_activity < oldest_time) {
            oldest_time = it->second->last_activity;
            oldest = it;
        }
    }
    if (oldest != sessions_.end()) {
        utils::log::debug(std::format("SessionStore: evicting session {}", oldest->first));
        sessions_.erase(oldest);
    }
}

void SessionStore::append(const std::string& session_id, Turn turn) {
    const auto session = get_or_create(session_id);
    std::lock_guard lock(session->mutex);
    session->history.push_back(std::move(turn));
    while (session->history.size() > config_.max_history) {
        session->history.pop_front();
    }
    session->last_activity = std::chrono::steady_clock::now();
}

std::vector<Turn> SessionStore::window(const std::string& session_id, size_t n) const {
    const auto session = find(session_id);
    if (!session) {
        return {};
    }
    std::lock_guard lock(session->mutex);
    const size_t count = std::min(n, session->history.size());
    return {session->history.end() - static_cast<std::ptrdiff_t>(count), session->history.end()};
}

std::vector<Turn> SessionStore::history(const std::string& session_id) const {
    const auto session = find(session_id);
    if (!session) {
        return {};
    }
    std::lock_guard lock(session->mutex);
    return {session->history.begin(), session->history.end()};
}

std::optional<Turn> SessionStore::last_turn(const std::string& session_id) const {
    const auto session = find(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard lock(session->mutex);
    if (session->history.empty()) {
        return std::nullopt;
    }
    return session->history.back();
}

size_t SessionStore::sweep_expired() {
    const auto cutoff = std::chrono::steady_clock::now() - config_.idle_timeout;
    size_t removed = 0;

    std::unique_lock lock(map_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        bool expired = false;
        {
            std::lock_guard session_lock(it->second->mutex);
            expired = it->second->last_activity < cutoff;
        }
        if (expired) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        utils::log::debug(std::format("SessionStore: swept {} idle session(s)", removed));
    }
    return removed;
}

void SessionStore::clear(const std::string& session_id) {
    std::unique_lock lock(map_mutex_);
    sessions_.erase(session_id);
}

size_t SessionStore::session_count() const {
    std::shared_lock lock(map_mutex_);
    return sessions_.size();
}

} // namespace sqlrag
