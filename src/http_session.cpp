#include "http_session.hpp"
#include "connection_manager.hpp"
#include "metrics.hpp"
#include "server_logger.hpp"

namespace redirector {

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    TxtLookup& lookup,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , conn_manager_(conn_manager)
    , health_handler_(config, conn_manager)
    , redirect_handler_(config, lookup)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto ep = lowest_layer().socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP Session state
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    TxtLookup& lookup,
    CertCache* challenge_store,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , conn_manager_(conn_manager)
    , health_handler_(config, conn_manager)
    , redirect_handler_(config, lookup)
    , conn_guard_(std::move(conn_guard))
{
    if (challenge_store) {
        challenge_handler_.emplace(*challenge_store);
    }
    beast::error_code ec;
    auto ep = lowest_layer().socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

HttpSession::~HttpSession() {
    conn_manager_.remove_session(this);
}

beast::tcp_stream& HttpSession::lowest_layer() {
    if (is_tls_) {
        return beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
    }
    return std::get<beast::tcp_stream>(stream_);
}

// Starts the asynchronous session activity
void HttpSession::run() {
    if (is_tls_) {
        // The SNI callback picks the certificate during the handshake.
        lowest_layer().expires_after(std::chrono::seconds(config_.read_timeout_sec));
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::drain() {
    net::post(lowest_layer().get_executor(), [self = shared_from_this()]() {
        self->draining_ = true;
        if (self->awaiting_request_) {
            self->lowest_layer().close();
        }
    });
}

void HttpSession::close() {
    net::post(lowest_layer().get_executor(), [self = shared_from_this()]() {
        self->lowest_layer().close();
    });
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure; certificate problems are logged by the SNI callback.
        return;
    }
    do_read();
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    if (draining_) {
        do_close();
        return;
    }

    req_ = {};
    awaiting_request_ = true;

    lowest_layer().expires_after(std::chrono::seconds(config_.read_timeout_sec));

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_body_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t) {
    awaiting_request_ = false;

    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        send_response(handle_too_large());
        return;
    }
    if (ec) {
        return;
    }

    req_ = parser_->release();
    try {
        handle_request();
    } catch (const std::exception& e) {
        // A handler failure costs this request, never the io thread.
        MetricsRegistry::instance().increment_counter("http_internal_error_total");
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::LIFECYCLE, remote_addr_,
                          std::string("Request handling failed: ") + e.what());
        send_response(handle_internal_error());
    }
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    auto method = req_.method();

    // --- Routing Table ---

    // Health Checks & Metrics
    if (path == "/healthz") {
        send_response(health_handler_.handle_health(req_));
        return;
    }
    if (path == "/stats" && method == http::verb::get && health_handler_.admin_allowed(req_, remote_addr_)) {
        send_response(health_handler_.handle_stats(req_));
        return;
    }
    if (path == "/metrics" && method == http::verb::get && health_handler_.admin_allowed(req_, remote_addr_)) {
        send_response(health_handler_.handle_metrics(req_));
        return;
    }

    // ACME HTTP-01 challenges (plain listener in TLS mode)
    if (challenge_handler_) {
        if (auto res = challenge_handler_->handle(req_, remote_addr_)) {
            send_response(std::move(*res));
            return;
        }
    }

    send_response(redirect_handler_.handle(req_, remote_addr_));
}

http::response<http::string_body> HttpSession::handle_internal_error() {
    http::response<http::string_body> res{http::status::internal_server_error, req_.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "internal server error\n";
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_too_large() {
    http::response<http::string_body> res{http::status::payload_too_large, 11};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "request body too large\n";
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

template<class Body>
void HttpSession::add_server_headers(http::response<Body>& res) {
    res.set(http::field::server, "redirector");
    res.set("X-Content-Type-Options", "nosniff");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    add_server_headers(res);
    if (draining_) {
        res.keep_alive(false);
    }

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    lowest_layer().expires_after(std::chrono::seconds(config_.write_timeout_sec));

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        return;
    }

    if (close || draining_) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    awaiting_request_ = false;
    beast::error_code ec;
    if (is_tls_) {
        lowest_layer().expires_after(std::chrono::seconds(config_.write_timeout_sec));
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_shutdown(
            [self = shared_from_this()](beast::error_code) {
                self->lowest_layer().close();
            });
        return;
    }
    lowest_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
