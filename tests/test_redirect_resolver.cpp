#include <gtest/gtest.h>
#include "redirect_resolver.hpp"
#include "errors.hpp"

using namespace redirector;

TEST(RedirectResolverTest, Simple) {
    std::vector<std::string> txt = {
        "Redirects from /test/* to https://github.com/holic/*",
    };

    EXPECT_EQ(RedirectResolver::resolve(txt, "/test/").location, "https://github.com/holic/");
    EXPECT_EQ(RedirectResolver::resolve(txt, "/test/success"),
              (Redirect{"https://github.com/holic/success", 302}));

    try {
        RedirectResolver::resolve(txt, "/should/fail");
        FAIL() << "expected NoMatchError";
    } catch (const NoMatchError& e) {
        EXPECT_STREQ(e.what(), "No paths matched");
    }
}

TEST(RedirectResolverTest, CatchAllsApplyLast) {
    // The catch-all sits between scoped rules but only applies after them
    std::vector<std::string> txt = {
        "Redirects from /test/* to https://github.com/holic/*",
        "Redirects to https://github.com/holic",
        "Redirects from /noglob/ to https://github.com/holic/noglob",
    };

    EXPECT_EQ(RedirectResolver::resolve(txt, "/").location, "https://github.com/holic");
    EXPECT_EQ(RedirectResolver::resolve(txt, "/test/somepath").location, "https://github.com/holic/somepath");
    EXPECT_EQ(RedirectResolver::resolve(txt, "/noglob/").location, "https://github.com/holic/noglob");
    EXPECT_EQ(RedirectResolver::resolve(txt, "/catch/all").location, "https://github.com/holic");
}

TEST(RedirectResolverTest, FirstScopedMatchWins) {
    std::vector<std::string> txt = {
        "Redirects from /a/* to https://first.example/*",
        "Redirects from /a/b to https://second.example/",
    };
    EXPECT_EQ(RedirectResolver::resolve(txt, "/a/b").location, "https://first.example/b");
}

TEST(RedirectResolverTest, FirstCatchAllWins) {
    std::vector<std::string> txt = {
        "Redirects to https://one.example/",
        "Redirects permanently to https://two.example/",
    };
    EXPECT_EQ(RedirectResolver::resolve(txt, "/x"), (Redirect{"https://one.example/", 302}));
}

TEST(RedirectResolverTest, UnparseableRecordsSkipped) {
    std::vector<std::string> txt = {
        "v=spf1 include:example.com ~all",
        "Redirects from /a/*/b to https://x/*",
        "Redirects permanently to https://example.com/",
    };
    EXPECT_EQ(RedirectResolver::resolve(txt, "/anything"), (Redirect{"https://example.com/", 301}));
}

TEST(RedirectResolverTest, NothingUsable) {
    EXPECT_THROW(RedirectResolver::resolve({}, "/"), NoMatchError);
    EXPECT_THROW(RedirectResolver::resolve({"hello world"}, "/"), NoMatchError);
}
