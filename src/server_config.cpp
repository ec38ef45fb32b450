#include "server_config.hpp"

#include <cstdlib>
#include <limits>

namespace redirector {

namespace {

long long parse_integer(const std::string& name, const std::string& value, long long min, long long max) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid value for " + name + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid value for " + name + ": '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw ConfigError(name + " out of range: " + value);
    }
    return parsed;
}

uint16_t parse_port(const std::string& name, const std::string& value) {
    return static_cast<uint16_t>(parse_integer(name, value, 1, 65535));
}

int parse_int(const std::string& name, const std::string& value, int min) {
    return static_cast<int>(parse_integer(name, value, min, std::numeric_limits<int>::max()));
}

const char* env(const char* name) {
    return std::getenv(name);
}

} // namespace

std::string usage(const std::string& program) {
    return "Usage: " + program + " [port] [options]\n"
           "Options:\n"
           "  --help, -h     Show this help\n"
           "Environment:\n"
           "  PORT, FALLBACK_URL, CERT_DIR, REDIRECTOR_ADDR, REDIRECTOR_HTTP_PORT,\n"
           "  REDIRECTOR_HTTPS_PORT, REDIRECTOR_REDIS_URL, REDIRECTOR_ACME_COMMAND,\n"
           "  REDIRECTOR_PSL_PATH, REDIRECTOR_CERTS_PER_WEEK, REDIRECTOR_DNS_TIMEOUT_MS,\n"
           "  REDIRECTOR_SHUTDOWN_GRACE_SEC, REDIRECTOR_THREADS, REDIRECTOR_MAX_CONNS_PER_IP,\n"
           "  REDIRECTOR_ADMIN_TOKEN\n";
}

ArgumentResult parse_arguments(const std::vector<std::string>& args, ServerConfig& config) {
    ArgumentResult result;
    bool port_seen = false;
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("unknown option: " + arg);
        } else if (port_seen) {
            throw ConfigError("unexpected argument: " + arg);
        } else {
            config.port = parse_port("port", arg);
            port_seen = true;
        }
    }
    return result;
}

void apply_environment(ServerConfig& config) {
    if (const char* e = env("PORT")) config.port = parse_port("PORT", e);
    if (const char* e = env("REDIRECTOR_ADDR")) config.address = e;
    if (const char* e = env("REDIRECTOR_HTTP_PORT")) config.http_port = parse_port("REDIRECTOR_HTTP_PORT", e);
    if (const char* e = env("REDIRECTOR_HTTPS_PORT")) config.https_port = parse_port("REDIRECTOR_HTTPS_PORT", e);

    // An empty FALLBACK_URL keeps the built-in default.
    if (const char* e = env("FALLBACK_URL")) {
        if (*e) config.fallback_url = e;
    }

    if (const char* e = env("CERT_DIR")) config.cert_dir = e;
    if (const char* e = env("REDIRECTOR_REDIS_URL")) config.redis_url = e;
    if (const char* e = env("REDIRECTOR_ACME_COMMAND")) config.acme_command = e;
    if (const char* e = env("REDIRECTOR_PSL_PATH")) config.public_suffix_path = e;
    if (const char* e = env("REDIRECTOR_ADMIN_TOKEN")) config.admin_token = e;

    if (const char* e = env("REDIRECTOR_CERTS_PER_WEEK")) {
        config.certs_per_apex_per_week = parse_int("REDIRECTOR_CERTS_PER_WEEK", e, 1);
    }
    if (const char* e = env("REDIRECTOR_DNS_TIMEOUT_MS")) {
        config.dns_timeout_ms = parse_int("REDIRECTOR_DNS_TIMEOUT_MS", e, 1);
    }
    if (const char* e = env("REDIRECTOR_SHUTDOWN_GRACE_SEC")) {
        config.shutdown_grace_sec = parse_int("REDIRECTOR_SHUTDOWN_GRACE_SEC", e, 0);
    }
    if (const char* e = env("REDIRECTOR_THREADS")) {
        config.thread_count = parse_int("REDIRECTOR_THREADS", e, 0);
    }
    if (const char* e = env("REDIRECTOR_MAX_CONNS_PER_IP")) {
        config.max_connections_per_ip = static_cast<size_t>(parse_int("REDIRECTOR_MAX_CONNS_PER_IP", e, 1));
    }
}

}
