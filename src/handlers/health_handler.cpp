#include "handlers/health_handler.hpp"

namespace redirector {

namespace {

const auto process_start = std::chrono::steady_clock::now();

} // namespace

http::response<http::string_body> HealthHandler::handle_health(const http::request<http::string_body>& req) {
    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = "ok\n";
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    auto& metrics = MetricsRegistry::instance();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - process_start).count();

    json::object response;
    response["active_connections"] = static_cast<int64_t>(conn_manager_.connection_count());
    response["uptime_sec"] = static_cast<int64_t>(uptime);
    response["tls"] = config_.tls_enabled();
    response["certs_per_apex_per_week"] = config_.certs_per_apex_per_week;
    response["redirects_resolved"] = metrics.get_counter("redirect_resolved_total");
    response["fallbacks_no_match"] = metrics.get_counter("redirect_fallback_no_match_total");
    response["fallbacks_dns"] = metrics.get_counter("redirect_fallback_dns_total");
    response["certs_issued"] = metrics.get_counter("cert_issued_total");
    response["certs_rate_limited"] = metrics.get_counter("cert_rate_limited_total");

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(const http::request<http::string_body>& req) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) const {
    // If no token is configured, only loopback peers get access.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    return provided_token == config_.admin_token;
}

bool HealthHandler::admin_allowed(const http::request<http::string_body>& req, const std::string& remote_addr) const {
    bool is_local = (remote_addr == "127.0.0.1" || remote_addr == "::1");
    return is_local || verify_admin_request(req);
}

} // namespace redirector
