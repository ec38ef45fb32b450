#include "public_suffix.hpp"
#include "server_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace redirector {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

PublicSuffixList PublicSuffixList::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("public suffix list not readable: " + path);
    }
    auto list = parse(in);
    if (list.rule_count() == 0) {
        throw ConfigError("public suffix list has no rules: " + path);
    }
    return list;
}

PublicSuffixList PublicSuffixList::parse(std::istream& in) {
    PublicSuffixList list;
    std::string line;
    while (std::getline(in, line)) {
        // Rules end at the first whitespace; anything after is ignored.
        auto end = std::find_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
        std::string rule(line.begin(), end);
        if (rule.empty() || rule.rfind("//", 0) == 0) continue;
        list.add_rule(rule);
    }
    return list;
}

void PublicSuffixList::add_rule(const std::string& raw) {
    std::string rule = to_lower(raw);
    if (rule.empty()) return;

    if (rule[0] == '!') {
        exceptions_.insert(rule.substr(1));
    } else if (rule.rfind("*.", 0) == 0) {
        wildcards_.insert(rule.substr(2));
    } else {
        rules_.insert(rule);
    }
}

std::vector<std::string> PublicSuffixList::split_labels(const std::string& domain) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t dot = domain.find('.', start);
        if (dot == std::string::npos) {
            labels.push_back(domain.substr(start));
            break;
        }
        labels.push_back(domain.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

std::string PublicSuffixList::join_labels(const std::vector<std::string>& labels, size_t from) {
    std::string out;
    for (size_t i = from; i < labels.size(); ++i) {
        if (!out.empty()) out += '.';
        out += labels[i];
    }
    return out;
}

size_t PublicSuffixList::suffix_label_count(const std::vector<std::string>& labels) const {
    const size_t n = labels.size();
    // Longest candidate first; the first rule hit is the prevailing one.
    for (size_t i = 0; i < n; ++i) {
        std::string candidate = join_labels(labels, i);
        if (exceptions_.count(candidate)) {
            return n - i - 1;
        }
        if (rules_.count(candidate)) {
            return n - i;
        }
        if (i + 1 < n && wildcards_.count(join_labels(labels, i + 1))) {
            return n - i;
        }
    }
    return 1;
}

std::string PublicSuffixList::public_suffix(const std::string& domain) const {
    auto labels = split_labels(to_lower(domain));
    return join_labels(labels, labels.size() - suffix_label_count(labels));
}

std::optional<std::string> PublicSuffixList::registrable_domain(const std::string& domain) const {
    if (domain.empty() || domain.front() == '.' || domain.back() == '.') {
        return std::nullopt;
    }

    auto labels = split_labels(to_lower(domain));
    if (std::any_of(labels.begin(), labels.end(), [](const std::string& l) { return l.empty(); })) {
        return std::nullopt;
    }

    size_t suffix_labels = suffix_label_count(labels);
    if (labels.size() <= suffix_labels) {
        return std::nullopt;
    }
    return join_labels(labels, labels.size() - suffix_labels - 1);
}

} // namespace redirector
