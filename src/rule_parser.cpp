#include "rule_parser.hpp"

#include <algorithm>
#include <cctype>

namespace redirector {

namespace {

const std::string KW_REDIRECTS = "Redirects";
const std::string KW_PERMANENTLY = "permanently";
const std::string KW_FROM = "from";
const std::string KW_TO = "to";
const std::string KW_WITH = "with";

} // namespace

std::vector<std::string> RuleParser::tokenize(const std::string& record) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : record) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::optional<int> RuleParser::parse_status(const std::string& token) {
    if (token.size() != 3) return std::nullopt;
    if (!std::all_of(token.begin(), token.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        })) {
        return std::nullopt;
    }
    int code = std::stoi(token);
    switch (code) {
        case 301: case 302: case 303: case 307: case 308:
            return code;
        default:
            // 300, 304, 305 and 306 are not redirects a browser follows
            return std::nullopt;
    }
}

bool RuleParser::has_valid_wildcard(const std::string& pattern) {
    auto pos = pattern.find(WILDCARD);
    return pos == std::string::npos || pos == pattern.size() - 1;
}

bool RuleParser::ends_with_wildcard(const std::string& pattern) {
    return !pattern.empty() && pattern.back() == WILDCARD;
}

std::optional<RedirectRule> RuleParser::parse(const std::string& record) {
    auto tokens = tokenize(record);
    size_t i = 0;

    auto next_is = [&](const std::string& kw) {
        return i < tokens.size() && tokens[i] == kw;
    };

    if (!next_is(KW_REDIRECTS)) return std::nullopt;
    ++i;

    RedirectRule rule;

    if (next_is(KW_PERMANENTLY)) {
        rule.status = PERMANENT_STATUS;
        ++i;
    }

    if (next_is(KW_FROM)) {
        ++i;
        if (i >= tokens.size()) return std::nullopt;
        rule.from = tokens[i++];
    }

    if (!next_is(KW_TO)) return std::nullopt;
    ++i;
    if (i >= tokens.size()) return std::nullopt;
    rule.to = tokens[i++];

    if (next_is(KW_WITH)) {
        ++i;
        if (i >= tokens.size()) return std::nullopt;
        auto status = parse_status(tokens[i++]);
        if (!status) return std::nullopt;
        rule.status = *status;
    }

    // Trailing garbage
    if (i != tokens.size()) return std::nullopt;

    if (!has_valid_wildcard(rule.to)) return std::nullopt;
    if (rule.from) {
        if (!has_valid_wildcard(*rule.from)) return std::nullopt;
        // The captured suffix must have somewhere to go, and a target
        // wildcard needs a capture to fill it.
        if (ends_with_wildcard(*rule.from) != ends_with_wildcard(rule.to)) {
            return std::nullopt;
        }
    } else if (ends_with_wildcard(rule.to)) {
        return std::nullopt;
    }

    return rule;
}

} // namespace redirector
