#include "handlers/redirect_handler.hpp"
#include "redirect_resolver.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "server_logger.hpp"

#include <cctype>
#include <chrono>

namespace redirector {

namespace {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string status_text(int status) {
    auto s = http::int_to_status(static_cast<unsigned>(status));
    if (s == http::status::unknown) return "";
    return std::string(http::obsolete_reason(s));
}

bool has_scheme(const std::string& location) {
    for (size_t i = 0; i < location.size(); ++i) {
        char c = location[i];
        if (c == ':') return i > 0;
        if (std::isalpha(static_cast<unsigned char>(c))) continue;
        if (i > 0 && (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.')) continue;
        return false;
    }
    return false;
}

} // namespace

std::string RedirectHandler::host_from_header(const std::string& host_header) {
    return host_header.substr(0, host_header.find(':'));
}

std::string RedirectHandler::query_escape(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string RedirectHandler::fallback_location(const std::string& fallback_url, const std::string& reason) {
    if (reason.empty()) return fallback_url;
    return fallback_url + "#reason=" + query_escape(reason);
}

std::string RedirectHandler::absolute_location(const std::string& location, const std::string& request_target) {
    if (location.empty() || location[0] == '/' || has_scheme(location)) {
        return location;
    }
    std::string path = request_target.substr(0, request_target.find('?'));
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return "/" + location;
    }
    return path.substr(0, slash + 1) + location;
}

Redirect RedirectHandler::decide(const std::string& host, const std::string& path, const std::string& remote_addr) {
    const std::string name = redirect_record_name(host);
    auto ctx = RequestContext::with_timeout(std::chrono::milliseconds(config_.dns_timeout_ms));

    std::vector<std::string> records;
    try {
        records = lookup_.lookup_txt(name, ctx);
    } catch (const RedirectError& e) {
        // DnsLookupError, or the deadline passing before the query went out.
        MetricsRegistry::instance().increment_counter("redirect_fallback_dns_total");
        ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::DNS_FAILURE,
                          remote_addr, e.what());
        return Redirect{fallback_location(config_.fallback_url,
                                          std::string("Could not resolve hostname (") + e.what() + ")"),
                        302};
    }

    try {
        auto redirect = RedirectResolver::resolve(records, path);
        MetricsRegistry::instance().increment_counter("redirect_resolved_total");
        return redirect;
    } catch (const NoMatchError& e) {
        MetricsRegistry::instance().increment_counter("redirect_fallback_no_match_total");
        ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::FALLBACK,
                          remote_addr, std::string(e.what()) + " for " + host);
        return Redirect{fallback_location(config_.fallback_url, e.what()), 302};
    }
}

http::response<http::string_body> RedirectHandler::make_redirect(const Redirect& redirect,
                                                                 const http::request<http::string_body>& req) {
    http::response<http::string_body> res;
    res.version(req.version());
    res.result(static_cast<unsigned>(redirect.status));
    res.keep_alive(req.keep_alive());

    std::string location = absolute_location(redirect.location, std::string(req.target()));
    res.set(http::field::location, location);
    if (redirect.status == 301) {
        res.set(http::field::cache_control, "max-age=86400");
    }

    if (req.method() == http::verb::get || req.method() == http::verb::head) {
        std::string body = "<a href=\"" + html_escape(location) + "\">" + status_text(redirect.status) + "</a>.\n";
        res.set(http::field::content_type, "text/html; charset=utf-8");
        if (req.method() == http::verb::head) {
            res.content_length(body.size());
            return res;
        }
        res.body() = std::move(body);
    }
    res.prepare_payload();
    return res;
}

http::response<http::string_body> RedirectHandler::handle(const http::request<http::string_body>& req,
                                                          const std::string& remote_addr) {
    std::string host = host_from_header(std::string(req[http::field::host]));
    std::string path(req.target());
    return make_redirect(decide(host, path, remote_addr), req);
}

} // namespace redirector
