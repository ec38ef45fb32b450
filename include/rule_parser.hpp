#pragma once

#include <optional>
#include <string>
#include <vector>

namespace redirector {

// Parsed form of a single `_redirect` TXT record.
struct RedirectRule {
    std::optional<std::string> from;  // absent: catch-all
    std::string to;
    int status = 302;

    bool is_catch_all() const { return !from.has_value(); }
};

// Parser for the TXT record grammar:
//
//   Redirects [permanently] [from <path>] to <target> [with <code>]
//
// Keywords are case-sensitive, tokens are separated by whitespace.
// A wildcard `*` may only appear once, as the last character of a pattern,
// and a wildcard source requires a wildcard target.
class RuleParser {
public:
    static constexpr char WILDCARD = '*';
    static constexpr int DEFAULT_STATUS = 302;
    static constexpr int PERMANENT_STATUS = 301;

    /**
     * Parses one TXT record.
     * @param record Raw record text as returned by the resolver.
     * @return The rule, or nothing when the record is not a redirect rule.
     *         Unrelated records (SPF, DKIM, free text) land here and are not errors.
     */
    static std::optional<RedirectRule> parse(const std::string& record);

    // Exposed for the matcher: true when `*` only appears as the final character.
    static bool has_valid_wildcard(const std::string& pattern);
    static bool ends_with_wildcard(const std::string& pattern);

private:
    static std::vector<std::string> tokenize(const std::string& record);
    static std::optional<int> parse_status(const std::string& token);
};

} // namespace redirector
