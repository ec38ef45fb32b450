#include <mutex>
#include <vector>
#include "connection_manager.hpp"
#include "http_session.hpp"
#include "metrics.hpp"

namespace redirector {

ConnectionManager::ConnectionManager(size_t max_per_ip, size_t max_global)
    : max_per_ip_(max_per_ip)
    , max_global_(max_global)
{}

bool ConnectionManager::try_reserve(const std::string& ip) {
    if (draining_) return false;

    std::unique_lock lock(connections_mutex_);
    if (total_ >= max_global_) {
        return false;
    }
    size_t& count = ip_counts_[ip];
    if (count >= max_per_ip_) {
        if (count == 0) ip_counts_.erase(ip);
        return false;
    }
    ++count;
    ++total_;
    MetricsRegistry::instance().increment_gauge("active_connections");
    return true;
}

void ConnectionManager::release(const std::string& ip) {
    std::unique_lock lock(connections_mutex_);
    auto it = ip_counts_.find(ip);
    if (it == ip_counts_.end()) return;

    if (it->second > 0) {
        it->second--;
        if (total_ > 0) total_--;
        MetricsRegistry::instance().decrement_gauge("active_connections");
    }
    if (it->second == 0) {
        ip_counts_.erase(it);
    }
}

void ConnectionManager::add_session(const SessionPtr& session) {
    std::unique_lock lock(connections_mutex_);
    sessions_[session.get()] = session;
}

void ConnectionManager::remove_session(HttpSession* session) {
    if (!session) return;
    std::unique_lock lock(connections_mutex_);
    sessions_.erase(session);
}

size_t ConnectionManager::connection_count() const {
    std::shared_lock lock(connections_mutex_);
    return total_;
}

size_t ConnectionManager::connection_count_for_ip(const std::string& ip_address) const {
    std::shared_lock lock(connections_mutex_);
    auto it = ip_counts_.find(ip_address);
    if (it != ip_counts_.end()) {
        return it->second;
    }
    return 0;
}

size_t ConnectionManager::session_count() const {
    std::shared_lock lock(connections_mutex_);
    return sessions_.size();
}

std::vector<ConnectionManager::SessionPtr> ConnectionManager::live_sessions() const {
    std::vector<SessionPtr> active;
    std::shared_lock lock(connections_mutex_);
    for (auto const& [raw, weak_session] : sessions_) {
        if (auto session = weak_session.lock()) {
            active.push_back(session);
        }
    }
    return active;
}

void ConnectionManager::begin_drain() {
    draining_ = true;
    for (auto const& session : live_sessions()) {
        session->drain();
    }
}

void ConnectionManager::close_all_connections() {
    for (auto const& session : live_sessions()) {
        session->close();
    }
}

}
