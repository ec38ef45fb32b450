#pragma once

#include <boost/beast/http.hpp>
#include <optional>
#include <string>

#include "cert_cache.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace redirector {

// Serves HTTP-01 challenge responses on the plain listener in TLS mode.
// The ACME client leaves each key authorization under "<token>+http-01".
class AcmeChallengeHandler {
public:
    static constexpr const char* PATH_PREFIX = "/.well-known/acme-challenge/";

    explicit AcmeChallengeHandler(CertCache& store) : store_(store) {}

    // Token named by a challenge request target, if it is one.
    static std::optional<std::string> token_from_target(const std::string& target);

    static std::string key_for_token(const std::string& token) { return token + "+http-01"; }

    // Nothing when the target is not a challenge or the token is unknown;
    // the request then goes to redirect handling.
    std::optional<http::response<http::string_body>> handle(const http::request<http::string_body>& req,
                                                           const std::string& remote_addr);

private:
    CertCache& store_;
};

} // namespace redirector
