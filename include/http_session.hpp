#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "cert_cache.hpp"
#include "txt_lookup.hpp"

#include "handlers/acme_challenge_handler.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/redirect_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace redirector {

class ConnectionManager;

// One HTTP/1.1 connection, plain or TLS, serving requests until the peer
// closes, a timeout fires, or the server drains.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        TxtLookup& lookup,
        std::shared_ptr<void> conn_guard
    );

    // `challenge_store` is set on the plain listener in TLS mode only.
    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        TxtLookup& lookup,
        CertCache* challenge_store,
        std::shared_ptr<void> conn_guard
    );

    ~HttpSession();

    void run();

    // Close after the response in progress; an idle connection closes now.
    void drain();

    // Close immediately.
    void close();

    const std::string& remote_address() const { return remote_addr_; }

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;

    // Handlers
    HealthHandler health_handler_;
    RedirectHandler redirect_handler_;
    std::optional<AcmeChallengeHandler> challenge_handler_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    bool awaiting_request_ = false;
    bool draining_ = false;

    beast::tcp_stream& lowest_layer();

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    http::response<http::string_body> handle_too_large();
    http::response<http::string_body> handle_internal_error();

    template<class Body>
    void add_server_headers(http::response<Body>& res);
};

}
