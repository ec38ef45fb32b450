#pragma once

#include <boost/beast/http.hpp>
#include <string>

#include "server_config.hpp"
#include "txt_lookup.hpp"
#include "rule_matcher.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace redirector {

// Answers every request that is not an operational endpoint: looks up the
// host's `_redirect` TXT records and redirects accordingly, or redirects to
// the fallback URL with the reason in the fragment.
class RedirectHandler {
public:
    RedirectHandler(const ServerConfig& config, TxtLookup& lookup)
        : config_(config), lookup_(lookup) {}

    http::response<http::string_body> handle(const http::request<http::string_body>& req,
                                             const std::string& remote_addr);

    // Decision for `host` and `path`, with failures already turned into the fallback.
    Redirect decide(const std::string& host, const std::string& path, const std::string& remote_addr);

    // Host header without the port.
    static std::string host_from_header(const std::string& host_header);

    // Form encoding of `value`: unreserved bytes kept, space as '+', the rest %XX.
    static std::string query_escape(const std::string& value);

    static std::string fallback_location(const std::string& fallback_url, const std::string& reason);

    // Resolves a scheme-less, non-rooted location against the request path's directory.
    static std::string absolute_location(const std::string& location, const std::string& request_target);

    static http::response<http::string_body> make_redirect(const Redirect& redirect,
                                                           const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    TxtLookup& lookup_;
};

} // namespace redirector
