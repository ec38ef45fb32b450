#include <gtest/gtest.h>
#include "cert_issuer.hpp"
#include "errors.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <random>

using namespace redirector;
namespace fs = std::filesystem;

class CertIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() /
              ("redirector-issuer-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string script(const std::string& name, const std::string& body) {
        fs::path path = dir / name;
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        ::chmod(path.c_str(), 0755);
        return path.string();
    }

    fs::path dir;
};

TEST_F(CertIssuerTest, ReturnsStdout) {
    ExecCertificateIssuer issuer(script("ok.sh", "echo \"bundle for $1\""), dir.string());
    EXPECT_EQ(issuer.issue("sub1.example.com", RequestContext()), "bundle for sub1.example.com\n");
}

TEST_F(CertIssuerTest, PassesChallengeDir) {
    ExecCertificateIssuer issuer(script("env.sh", "echo \"$REDIRECTOR_CHALLENGE_DIR\""), "/srv/challenges");
    EXPECT_EQ(issuer.issue("sub1.example.com", RequestContext()), "/srv/challenges\n");
}

TEST_F(CertIssuerTest, NonZeroExitFails) {
    ExecCertificateIssuer issuer(script("fail.sh", "echo partial; exit 3"), dir.string());
    try {
        issuer.issue("sub1.example.com", RequestContext());
        FAIL() << "expected IssuanceError";
    } catch (const IssuanceError& e) {
        EXPECT_NE(std::string(e.what()).find("exited with status 3"), std::string::npos);
    }
}

TEST_F(CertIssuerTest, EmptyOutputFails) {
    ExecCertificateIssuer issuer(script("quiet.sh", "exit 0"), dir.string());
    EXPECT_THROW(issuer.issue("sub1.example.com", RequestContext()), IssuanceError);
}

TEST_F(CertIssuerTest, MissingProgramFails) {
    ExecCertificateIssuer issuer((dir / "does-not-exist").string(), dir.string());
    EXPECT_THROW(issuer.issue("sub1.example.com", RequestContext()), IssuanceError);
}

TEST_F(CertIssuerTest, CancelledBeforeStart) {
    ExecCertificateIssuer issuer(script("ok.sh", "echo x"), dir.string());
    RequestContext ctx;
    ctx.cancel();
    EXPECT_THROW(issuer.issue("sub1.example.com", ctx), OperationCancelledError);
}

TEST_F(CertIssuerTest, SlowProgramIsKilled) {
    ExecCertificateIssuer issuer(script("slow.sh", "exec sleep 30"), dir.string(), std::chrono::seconds(1));
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(issuer.issue("sub1.example.com", RequestContext()), OperationCancelledError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
