#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>

#include "server_config.hpp"
#include "cert_cache.hpp"
#include "txt_lookup.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace redirector {

class ConnectionManager;

// Accepts connections on one endpoint and starts an HttpSession for each,
// subject to the connection limits.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    // `ssl_ctx` null: plain HTTP. `challenge_store` is only used by plain listeners.
    Listener(
        net::io_context& ioc,
        ssl::context* ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        TxtLookup& lookup,
        CertCache* challenge_store = nullptr
    );

    void run();
    void stop();

    tcp::endpoint local_endpoint() const;

private:
    net::io_context& ioc_;
    ssl::context* ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    TxtLookup& lookup_;
    CertCache* challenge_store_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

}
