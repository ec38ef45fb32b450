#include "handlers/acme_challenge_handler.hpp"
#include "errors.hpp"
#include "server_logger.hpp"

#include <cctype>
#include <chrono>

namespace redirector {

std::optional<std::string> AcmeChallengeHandler::token_from_target(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    const std::string prefix = PATH_PREFIX;
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string token = path.substr(prefix.size());
    if (token.empty()) return std::nullopt;
    for (char c : token) {
        // ACME tokens are base64url
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return std::nullopt;
        }
    }
    return token;
}

std::optional<http::response<http::string_body>> AcmeChallengeHandler::handle(
        const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto token = token_from_target(std::string(req.target()));
    if (!token) return std::nullopt;

    std::string body;
    try {
        body = store_.get(key_for_token(*token), RequestContext::with_timeout(std::chrono::seconds(5)));
    } catch (const CacheMissError&) {
        return std::nullopt;
    } catch (const RedirectError& e) {
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::STORE_FAILURE,
                          remote_addr, std::string("Challenge lookup failed: ") + e.what());
        return std::nullopt;
    }

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

} // namespace redirector
