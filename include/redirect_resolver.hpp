#pragma once

#include <string>
#include <vector>

#include "rule_matcher.hpp"

namespace redirector {

// Applies the `_redirect` TXT records of one host to a request path.
//
// Scoped rules (with a `from` pattern) are tried in record order and the first
// match wins. Catch-alls are only considered after every scoped rule has
// failed, in the order they appeared, regardless of where they sit among the
// records.
class RedirectResolver {
public:
    // Throws NoMatchError when nothing matches. Unparseable records are skipped.
    static Redirect resolve(const std::vector<std::string>& records, const std::string& path);
};

} // namespace redirector
