#include <gtest/gtest.h>
#include "server_config.hpp"

#include <cstdlib>

using namespace redirector;

namespace {

const char* const ENV_NAMES[] = {
    "PORT", "REDIRECTOR_ADDR", "REDIRECTOR_HTTP_PORT", "REDIRECTOR_HTTPS_PORT", "FALLBACK_URL",
    "CERT_DIR", "REDIRECTOR_REDIS_URL", "REDIRECTOR_ACME_COMMAND", "REDIRECTOR_PSL_PATH",
    "REDIRECTOR_ADMIN_TOKEN", "REDIRECTOR_CERTS_PER_WEEK", "REDIRECTOR_DNS_TIMEOUT_MS",
    "REDIRECTOR_SHUTDOWN_GRACE_SEC", "REDIRECTOR_THREADS", "REDIRECTOR_MAX_CONNS_PER_IP",
};

} // namespace

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.fallback_url, "http://redirect.name/");
    EXPECT_EQ(config.certs_per_apex_per_week, 2);
    EXPECT_EQ(config.read_timeout_sec, 5);
    EXPECT_EQ(config.write_timeout_sec, 5);
    EXPECT_EQ(config.shutdown_grace_sec, 10);
    EXPECT_FALSE(config.tls_enabled());
}

TEST(ServerConfigTest, PositionalPort) {
    ServerConfig config;
    auto res = parse_arguments({"9090"}, config);
    EXPECT_FALSE(res.show_help);
    EXPECT_EQ(config.port, 9090);
}

TEST(ServerConfigTest, HelpFlag) {
    ServerConfig config;
    EXPECT_TRUE(parse_arguments({"--help"}, config).show_help);
    EXPECT_TRUE(parse_arguments({"-h"}, config).show_help);
    EXPECT_EQ(config.port, 8081);
    EXPECT_NE(usage("redirector").find("Usage: redirector"), std::string::npos);
}

TEST(ServerConfigTest, BadArguments) {
    ServerConfig config;
    EXPECT_THROW(parse_arguments({"--verbose"}, config), ConfigError);
    EXPECT_THROW(parse_arguments({"80", "81"}, config), ConfigError);
    EXPECT_THROW(parse_arguments({"http"}, config), ConfigError);
    EXPECT_THROW(parse_arguments({"0"}, config), ConfigError);
    EXPECT_THROW(parse_arguments({"65536"}, config), ConfigError);
    EXPECT_THROW(parse_arguments({"80x"}, config), ConfigError);
}

class ServerConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : ENV_NAMES) ::unsetenv(name);
    }
};

TEST_F(ServerConfigEnvTest, EmptyEnvironmentKeepsDefaults) {
    ServerConfig config;
    apply_environment(config);
    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.fallback_url, "http://redirect.name/");
    EXPECT_FALSE(config.tls_enabled());
}

TEST_F(ServerConfigEnvTest, ReadsValues) {
    ::setenv("PORT", "9000", 1);
    ::setenv("FALLBACK_URL", "https://fallback.example.com/", 1);
    ::setenv("CERT_DIR", "/var/lib/redirector", 1);
    ::setenv("REDIRECTOR_CERTS_PER_WEEK", "5", 1);
    ::setenv("REDIRECTOR_DNS_TIMEOUT_MS", "1500", 1);
    ::setenv("REDIRECTOR_ADMIN_TOKEN", "secret", 1);

    ServerConfig config;
    apply_environment(config);
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.fallback_url, "https://fallback.example.com/");
    EXPECT_EQ(config.cert_dir, "/var/lib/redirector");
    EXPECT_TRUE(config.tls_enabled());
    EXPECT_EQ(config.certs_per_apex_per_week, 5);
    EXPECT_EQ(config.dns_timeout_ms, 1500);
    EXPECT_EQ(config.admin_token, "secret");
}

TEST_F(ServerConfigEnvTest, EmptyFallbackKeepsDefault) {
    ::setenv("FALLBACK_URL", "", 1);
    ServerConfig config;
    apply_environment(config);
    EXPECT_EQ(config.fallback_url, "http://redirect.name/");
}

TEST_F(ServerConfigEnvTest, EnvironmentOverridesArgument) {
    ServerConfig config;
    parse_arguments({"7000"}, config);
    ::setenv("PORT", "7001", 1);
    apply_environment(config);
    EXPECT_EQ(config.port, 7001);
}

TEST_F(ServerConfigEnvTest, RejectsBadValues) {
    ServerConfig config;
    ::setenv("PORT", "eighty", 1);
    EXPECT_THROW(apply_environment(config), ConfigError);
    ::unsetenv("PORT");

    ::setenv("REDIRECTOR_CERTS_PER_WEEK", "0", 1);
    EXPECT_THROW(apply_environment(config), ConfigError);
    ::unsetenv("REDIRECTOR_CERTS_PER_WEEK");

    ::setenv("REDIRECTOR_SHUTDOWN_GRACE_SEC", "-1", 1);
    EXPECT_THROW(apply_environment(config), ConfigError);
    ::unsetenv("REDIRECTOR_SHUTDOWN_GRACE_SEC");

    ::setenv("REDIRECTOR_SHUTDOWN_GRACE_SEC", "0", 1);
    EXPECT_NO_THROW(apply_environment(config));
    EXPECT_EQ(config.shutdown_grace_sec, 0);
}
