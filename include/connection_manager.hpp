#pragma once

#include <atomic>
#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <vector>

namespace redirector {

class HttpSession;

// Tracks live HTTP sessions for connection limits and graceful shutdown.
class ConnectionManager {
public:
    using SessionPtr = std::shared_ptr<HttpSession>;
    using WeakSessionPtr = std::weak_ptr<HttpSession>;

    ConnectionManager(size_t max_per_ip, size_t max_global);
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Reserves a connection slot for `ip`. Fails when the per-IP or global
    // limit is reached, or once draining has started.
    bool try_reserve(const std::string& ip);
    void release(const std::string& ip);

    void add_session(const SessionPtr& session);
    void remove_session(HttpSession* session);

    size_t connection_count() const;
    size_t connection_count_for_ip(const std::string& ip_address) const;
    size_t session_count() const;

    // Stops admitting connections and asks every session to close once its
    // current response is written. Idle keep-alive sessions close right away.
    void begin_drain();
    bool draining() const { return draining_.load(); }

    // Closes all tracked sessions immediately.
    void close_all_connections();

private:
    size_t max_per_ip_;
    size_t max_global_;
    std::atomic<bool> draining_{false};

    std::unordered_map<HttpSession*, WeakSessionPtr> sessions_;
    std::unordered_map<std::string, size_t> ip_counts_;
    size_t total_ = 0;

    mutable std::shared_mutex connections_mutex_;

    std::vector<SessionPtr> live_sessions() const;
};

}
