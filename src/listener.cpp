#include <boost/asio/strand.hpp>

#include "listener.hpp"
#include "connection_manager.hpp"
#include "http_session.hpp"
#include "metrics.hpp"
#include "server_logger.hpp"

namespace redirector {

Listener::Listener(
    net::io_context& ioc,
    ssl::context* ssl_ctx,
    tcp::endpoint endpoint,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    TxtLookup& lookup,
    CertCache* challenge_store
)
    : ioc_(ioc)
    , ssl_ctx_(ssl_ctx)
    , acceptor_(net::make_strand(ioc))
    , config_(config)
    , conn_manager_(conn_manager)
    , lookup_(lookup)
    , challenge_store_(challenge_store)
{
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind " + endpoint.address().to_string() + ":" +
                                 std::to_string(endpoint.port()) + ": " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

tcp::endpoint Listener::local_endpoint() const {
    return acceptor_.local_endpoint();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        return;
    }

    if (ec) {
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
    } else {
        beast::error_code ep_ec;
        auto ep = socket.remote_endpoint(ep_ec);
        std::string remote_ip = ep_ec ? "unknown" : ep.address().to_string();

        if (!conn_manager_.try_reserve(remote_ip)) {
            // Socket is closed when it goes out of scope here
            ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::CONNECTION_REJECTED,
                              remote_ip, conn_manager_.draining() ? "Server is shutting down" : "Connection limit reached");
            MetricsRegistry::instance().increment_counter("connection_rejected_total");
        } else {
            // Releases the connection slot when the session tree is destroyed
            ConnectionManager* manager = &conn_manager_;
            auto guard = std::shared_ptr<void>(nullptr, [manager, remote_ip](void*) {
                manager->release(remote_ip);
            });

            std::shared_ptr<HttpSession> session;
            if (ssl_ctx_) {
                session = std::make_shared<HttpSession>(
                    beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), *ssl_ctx_),
                    config_,
                    conn_manager_,
                    lookup_,
                    guard);
            } else {
                session = std::make_shared<HttpSession>(
                    beast::tcp_stream(std::move(socket)),
                    config_,
                    conn_manager_,
                    lookup_,
                    challenge_store_,
                    guard);
            }
            conn_manager_.add_session(session);
            session->run();
        }
    }

    do_accept();
}

}
