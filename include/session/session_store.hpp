#pragma once

#include "core/types.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrag {

/**
 * @brief Bounded per-session conversation history
 *
 * The session map is guarded by a shared_mutex; each session carries its
 * own mutex so concurrent requests on different sessions never contend.
 * History keeps at most max_history turns, oldest evicted first.
 */
class SessionStore {
public:
    struct Config {
        size_t max_history = 10;
        std::chrono::seconds idle_timeout{1800};
        size_t max_sessions = 10000;
    };

    SessionStore() : SessionStore(Config{}) {}
    explicit SessionStore(Config config);

    void append(const std::string& session_id, Turn turn);

    /**
     * @brief Most recent n turns, oldest first
     */
    [[nodiscard]] std::vector<Turn> window(const std::string& session_id, size_t n) const;

    [[nodiscard]] std::vector<Turn> history(const std::string& session_id) const;

    [[nodiscard]] std::optional<Turn> last_turn(const std::string& session_id) const;

    /**
     * @brief Drop sessions idle longer than idle_timeout
     * @return number of sessions removed
     */
    size_t sweep_expired();

    void clear(const std::string& session_id);

    [[nodiscard]] size_t session_count() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Session {
        std::deque<Turn> history;
        std::chrono::steady_clock::time_point last_activity;
        mutable std::mutex mutex;
    };

    std::shared_ptr<Session> find(const std::string& session_id) const;
    std::shared_ptr<Session> get_or_create(const std::string& session_id);
    void evict_oldest_locked();

    Config config_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace sqlrag
