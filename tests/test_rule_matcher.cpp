#include <gtest/gtest.h>
#include "rule_matcher.hpp"

using namespace redirector;

namespace {

RedirectRule rule_of(const std::string& record) {
    auto rule = RuleParser::parse(record);
    EXPECT_TRUE(rule.has_value()) << record;
    return rule.value_or(RedirectRule{});
}

} // namespace

TEST(RuleMatcherTest, CatchAllMatchesEverything) {
    auto rule = rule_of("Redirects to https://github.com/holic");
    for (const std::string path : {"/", "/anything", "/a/b?c=d", ""}) {
        auto r = RuleMatcher::translate(path, rule);
        ASSERT_TRUE(r.has_value()) << path;
        EXPECT_EQ(r->location, "https://github.com/holic");
        EXPECT_EQ(r->status, 302);
    }
}

TEST(RuleMatcherTest, ExactMatchOnly) {
    auto rule = rule_of("Redirects from /noglob/ to https://github.com/holic/noglob");
    auto r = RuleMatcher::translate("/noglob/", rule);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->location, "https://github.com/holic/noglob");

    EXPECT_FALSE(RuleMatcher::translate("/noglob", rule).has_value());
    EXPECT_FALSE(RuleMatcher::translate("/noglob/x", rule).has_value());
    EXPECT_FALSE(RuleMatcher::translate("/noglob/?q=1", rule).has_value());
}

TEST(RuleMatcherTest, PrefixWildcardAppendsSuffix) {
    auto rule = rule_of("Redirects from /test/* to https://github.com/holic/*");

    auto r = RuleMatcher::translate("/test/success", rule);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->location, "https://github.com/holic/success");

    auto empty_suffix = RuleMatcher::translate("/test/", rule);
    ASSERT_TRUE(empty_suffix.has_value());
    EXPECT_EQ(empty_suffix->location, "https://github.com/holic/");

    auto with_query = RuleMatcher::translate("/test/a/b?x=1", rule);
    ASSERT_TRUE(with_query.has_value());
    EXPECT_EQ(with_query->location, "https://github.com/holic/a/b?x=1");

    EXPECT_FALSE(RuleMatcher::translate("/should/fail", rule).has_value());
    EXPECT_FALSE(RuleMatcher::translate("/test", rule).has_value());
}

TEST(RuleMatcherTest, PrefixIsCharacterLevel) {
    auto rule = rule_of("Redirects from /docs* to https://example.com/d*");
    auto r = RuleMatcher::translate("/docsx", rule);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->location, "https://example.com/dx");

    auto slashed = rule_of("Redirects from /docs/* to https://example.com/*");
    EXPECT_FALSE(RuleMatcher::translate("/docsx", slashed).has_value());
    ASSERT_TRUE(RuleMatcher::translate("/docs/x", slashed).has_value());
}

TEST(RuleMatcherTest, StatusCarriedThrough) {
    auto rule = rule_of("Redirects permanently from /old/* to https://new.example/*");
    auto r = RuleMatcher::translate("/old/page", rule);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, 301);

    auto custom = rule_of("Redirects from /t to https://x.example/t with 307");
    EXPECT_EQ(RuleMatcher::translate("/t", custom)->status, 307);
}
