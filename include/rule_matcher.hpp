#pragma once

#include <optional>
#include <string>

#include "rule_parser.hpp"

namespace redirector {

// Outcome of applying a rule set to a request path.
struct Redirect {
    std::string location;
    int status;

    bool operator==(const Redirect& other) const {
        return location == other.location && status == other.status;
    }
};

class RuleMatcher {
public:
    /**
     * Applies a single rule to a request path.
     * Prefix matching is a plain character prefix test: `/docs/*` matches
     * both `/docs/x` and `/docsx`.
     * @return The redirect, or nothing when the rule does not match.
     */
    static std::optional<Redirect> translate(const std::string& path, const RedirectRule& rule);
};

} // namespace redirector
