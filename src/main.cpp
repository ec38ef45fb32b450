#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <functional>

#include "server_config.hpp"
#include "connection_manager.hpp"
#include "listener.hpp"
#include "txt_lookup.hpp"
#include "public_suffix.hpp"
#include "admission_gate.hpp"
#include "dir_cert_cache.hpp"
#include "redis_cert_cache.hpp"
#include "rate_limited_cert_cache.hpp"
#include "cert_issuer.hpp"
#include "cert_manager.hpp"
#include "server_logger.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Configures the base TLS context (TLS 1.2+). Certificates are chosen per
// handshake by the CertManager's SNI callback.
void configure_tls(ssl::context& ctx) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );
}

std::unique_ptr<redirector::CertCache> make_backend(const redirector::ServerConfig& config) {
    if (!config.redis_url.empty()) {
        auto redis = std::make_unique<redirector::RedisCertCache>(config.redis_url);
        if (!redis->is_connected()) {
            throw std::runtime_error("certificate store unreachable at " + config.redis_url);
        }
        return redis;
    }
    return std::make_unique<redirector::DirCertCache>(config.cert_dir);
}

} // namespace

int main(int argc, char* argv[]) {
    using redirector::ServerLogger;
    try {
        redirector::ServerConfig config;

        // --- CLI Argument Parsing, then Environment Variable Overrides ---
        try {
            auto args = redirector::parse_arguments(std::vector<std::string>(argv + 1, argv + argc), config);
            if (args.show_help) {
                std::cout << redirector::usage(argv[0]);
                return 0;
            }
            redirector::apply_environment(config);
        } catch (const redirector::ConfigError& e) {
            std::cerr << "[!] " << e.what() << "\n" << redirector::usage(argv[0]);
            return 1;
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        // Sessions left in the io_context at exit release their slots here, so the manager outlives it.
        redirector::ConnectionManager conn_manager(config.max_connections_per_ip, config.max_global_connections);
        redirector::SystemTxtLookup lookup(std::chrono::milliseconds(config.dns_timeout_ms));

        net::io_context ioc{config.thread_count};

        std::vector<std::shared_ptr<redirector::Listener>> listeners;

        // Certificate machinery, TLS mode only
        ssl::context ssl_ctx{ssl::context::tlsv12};
        std::unique_ptr<redirector::PublicSuffixList> suffixes;
        std::unique_ptr<redirector::DirCertCache> challenge_store;
        std::unique_ptr<redirector::RateLimitedCertCache> cert_store;
        std::unique_ptr<redirector::AdmissionGate> gate;
        std::unique_ptr<redirector::ExecCertificateIssuer> issuer;
        std::unique_ptr<redirector::CertManager> cert_manager;

        if (config.tls_enabled()) {
            try {
                suffixes = std::make_unique<redirector::PublicSuffixList>(
                    redirector::PublicSuffixList::load(config.public_suffix_path));
            } catch (const redirector::ConfigError& e) {
                std::cerr << "[!] " << e.what() << "\n";
                return 1;
            }
            ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::LIFECYCLE, "internal",
                              "Loaded " + std::to_string(suffixes->rule_count()) + " public suffix rules");
            challenge_store = std::make_unique<redirector::DirCertCache>(config.cert_dir);
            cert_store = std::make_unique<redirector::RateLimitedCertCache>(
                make_backend(config), *suffixes, config.certs_per_apex_per_week);
            gate = std::make_unique<redirector::AdmissionGate>(lookup);

            if (!config.acme_command.empty()) {
                issuer = std::make_unique<redirector::ExecCertificateIssuer>(
                    config.acme_command, std::filesystem::absolute(config.cert_dir).string());
            } else {
                ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::LIFECYCLE, "internal",
                                  "No ACME command configured, serving stored certificates only");
            }

            cert_manager = std::make_unique<redirector::CertManager>(*cert_store, *gate, issuer.get());
            configure_tls(ssl_ctx);
            cert_manager->attach(ssl_ctx);

            auto address = net::ip::make_address(config.address);
            listeners.push_back(std::make_shared<redirector::Listener>(
                ioc, nullptr, tcp::endpoint{address, config.http_port},
                config, conn_manager, lookup, challenge_store.get()));
            listeners.push_back(std::make_shared<redirector::Listener>(
                ioc, &ssl_ctx, tcp::endpoint{address, config.https_port},
                config, conn_manager, lookup));

            ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::LIFECYCLE, "internal",
                              "Listening on http://" + config.address + ":" + std::to_string(config.http_port) +
                              " and https://" + config.address + ":" + std::to_string(config.https_port));
        } else {
            listeners.push_back(std::make_shared<redirector::Listener>(
                ioc, nullptr, tcp::endpoint{net::ip::make_address(config.address), config.port},
                config, conn_manager, lookup));

            ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::LIFECYCLE, "internal",
                              "Listening on http://" + config.address + ":" + std::to_string(config.port));
        }

        for (auto& listener : listeners) {
            listener->run();
        }

        // Captured SIGINT and SIGTERM to perform a graceful shutdown: stop
        // accepting, let in-flight requests finish, force-close after the grace period.
        net::steady_timer grace_timer(ioc);
        std::chrono::steady_clock::time_point drain_deadline;
        std::function<void(beast::error_code)> on_drain_tick;
        on_drain_tick = [&](beast::error_code ec) {
            if (ec) return;
            size_t remaining = conn_manager.session_count();
            if (remaining > 0 && std::chrono::steady_clock::now() < drain_deadline) {
                grace_timer.expires_after(std::chrono::milliseconds(100));
                grace_timer.async_wait(on_drain_tick);
                return;
            }
            if (remaining > 0) {
                ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::LIFECYCLE, "internal",
                                  "Grace period over, closing " + std::to_string(remaining) + " connections");
                conn_manager.close_all_connections();
            }
            ioc.stop();
        };

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const& ec, int) {
                if (ec) return;
                ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::LIFECYCLE, "internal",
                                  "Shutting down...");
                for (auto& listener : listeners) {
                    listener->stop();
                }
                conn_manager.begin_drain();

                drain_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.shutdown_grace_sec);
                grace_timer.expires_after(std::chrono::milliseconds(0));
                grace_timer.async_wait(on_drain_tick);
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
