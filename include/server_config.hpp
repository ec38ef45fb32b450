#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace redirector {

// Thrown for an unusable command-line argument or environment value.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Core server configuration.
struct ServerConfig {
    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 8081;          // plain mode
    uint16_t http_port = 80;       // TLS mode: ACME challenges and redirects
    uint16_t https_port = 443;     // TLS mode
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Redirects ---
    std::string fallback_url = "http://redirect.name/";
    int dns_timeout_ms = 3000;

    // --- Certificates (TLS mode is enabled by a non-empty cert_dir) ---
    std::string cert_dir = "";
    std::string redis_url = "";    // shared certificate store; empty stores in cert_dir
    std::string acme_command = "";
    std::string public_suffix_path = "/usr/share/publicsuffix/public_suffix_list.dat";
    int certs_per_apex_per_week = 2;

    // --- Connection & Resource Management ---
    size_t max_body_size = 64 * 1024;
    size_t max_connections_per_ip = 64;
    size_t max_global_connections = 10000;
    int read_timeout_sec = 5;
    int write_timeout_sec = 5;
    int shutdown_grace_sec = 10;

    std::string admin_token = ""; // Used for privileged stats/metrics access

    bool tls_enabled() const { return !cert_dir.empty(); }
};

// Result of command-line parsing; `show_help` means print usage and exit 0.
struct ArgumentResult {
    bool show_help = false;
};

/**
 * Applies `redirector [port] [--help|-h]`.
 * @throws ConfigError on an unknown option or a bad port.
 */
ArgumentResult parse_arguments(const std::vector<std::string>& args, ServerConfig& config);

/**
 * Overrides fields from the REDIRECTOR_* / PORT / FALLBACK_URL / CERT_DIR environment.
 * @throws ConfigError on a non-numeric or out-of-range value.
 */
void apply_environment(ServerConfig& config);

std::string usage(const std::string& program);

}
