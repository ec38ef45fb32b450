#include <gtest/gtest.h>
#include "dir_cert_cache.hpp"
#include "errors.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <random>

using namespace redirector;
namespace fs = std::filesystem;

class DirCertCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() /
              ("redirector-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        cache = std::make_unique<DirCertCache>(dir / "certs");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    size_t file_count() {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(dir / "certs")) {
            (void)entry;
            ++n;
        }
        return n;
    }

    fs::path dir;
    std::unique_ptr<DirCertCache> cache;
};

TEST_F(DirCertCacheTest, PutThenGet) {
    cache->put("sub1.example.com", "pem-data", RequestContext());
    EXPECT_EQ(cache->get("sub1.example.com", RequestContext()), "pem-data");

    cache->put("sub1.example.com", "replaced", RequestContext());
    EXPECT_EQ(cache->get("sub1.example.com", RequestContext()), "replaced");
    EXPECT_EQ(file_count(), 1u);
}

TEST_F(DirCertCacheTest, BinarySafe) {
    std::string data("a\0b\xff", 4);
    cache->put("acme_account+key", data, RequestContext());
    EXPECT_EQ(cache->get("acme_account+key", RequestContext()), data);
}

TEST_F(DirCertCacheTest, MissingKey) {
    EXPECT_THROW(cache->get("nothing.example.com", RequestContext()), CacheMissError);
}

TEST_F(DirCertCacheTest, RemoveIsIdempotent) {
    cache->put("k", "v", RequestContext());
    cache->remove("k", RequestContext());
    EXPECT_THROW(cache->get("k", RequestContext()), CacheMissError);
    EXPECT_NO_THROW(cache->remove("k", RequestContext()));
}

TEST_F(DirCertCacheTest, PrivatePermissions) {
    cache->put("sub1.example.com", "secret", RequestContext());

    struct stat dst{};
    ASSERT_EQ(::stat((dir / "certs").c_str(), &dst), 0);
    EXPECT_EQ(dst.st_mode & 0777, 0700u);

    struct stat fst{};
    ASSERT_EQ(::stat((dir / "certs" / "sub1.example.com").c_str(), &fst), 0);
    EXPECT_EQ(fst.st_mode & 0777, 0600u);
}

TEST_F(DirCertCacheTest, CancelledPutWritesNothing) {
    RequestContext ctx;
    ctx.cancel();
    EXPECT_THROW(cache->put("sub1.example.com", "x", ctx), OperationCancelledError);
    EXPECT_THROW(cache->get("sub1.example.com", RequestContext()), CacheMissError);
}

TEST_F(DirCertCacheTest, ExpiredDeadlineWritesNothing) {
    auto ctx = RequestContext::with_timeout(std::chrono::seconds(-1));
    EXPECT_THROW(cache->put("sub1.example.com", "x", ctx), OperationCancelledError);
    EXPECT_FALSE(fs::exists(dir / "certs" / "sub1.example.com"));
}

TEST_F(DirCertCacheTest, RejectsPathKeys) {
    EXPECT_THROW(cache->put("../escape", "x", RequestContext()), StoreError);
    EXPECT_THROW(cache->put("", "x", RequestContext()), StoreError);
    EXPECT_THROW(cache->get("..", RequestContext()), StoreError);
}
