#include "redirect_resolver.hpp"
#include "errors.hpp"
#include "rule_parser.hpp"

namespace redirector {

Redirect RedirectResolver::resolve(const std::vector<std::string>& records, const std::string& path) {
    std::vector<RedirectRule> catch_alls;

    for (const auto& record : records) {
        auto rule = RuleParser::parse(record);
        if (!rule) continue;

        if (rule->is_catch_all()) {
            catch_alls.push_back(std::move(*rule));
            continue;
        }

        if (auto redirect = RuleMatcher::translate(path, *rule)) {
            return *redirect;
        }
    }

    for (const auto& rule : catch_alls) {
        if (auto redirect = RuleMatcher::translate(path, rule)) {
            return *redirect;
        }
    }

    throw NoMatchError();
}

} // namespace redirector
