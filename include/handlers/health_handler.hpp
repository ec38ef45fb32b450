#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <chrono>
#include "server_config.hpp"
#include "connection_manager.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace redirector {

// Operational endpoints: /healthz for load balancers, /stats and /metrics
// for operators (loopback or admin token only).
class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, ConnectionManager& conn_manager)
        : config_(config), conn_manager_(conn_manager) {}

    http::response<http::string_body> handle_health(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(const http::request<http::string_body>& req);

    bool verify_admin_request(const http::request<http::string_body>& req) const;

    // Loopback peers and admin-token holders may see /stats and /metrics.
    bool admin_allowed(const http::request<http::string_body>& req, const std::string& remote_addr) const;

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
};

} // namespace redirector
