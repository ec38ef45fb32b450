#include "rule_matcher.hpp"

namespace redirector {

std::optional<Redirect> RuleMatcher::translate(const std::string& path, const RedirectRule& rule) {
    if (rule.is_catch_all()) {
        return Redirect{rule.to, rule.status};
    }

    const std::string& from = *rule.from;

    if (!RuleParser::ends_with_wildcard(from)) {
        if (path != from) return std::nullopt;
        return Redirect{rule.to, rule.status};
    }

    std::string prefix = from.substr(0, from.size() - 1);
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string suffix = path.substr(prefix.size());
    std::string location = rule.to;
    if (RuleParser::ends_with_wildcard(location)) {
        location.pop_back();
    }
    location += suffix;

    return Redirect{std::move(location), rule.status};
}

} // namespace redirector
