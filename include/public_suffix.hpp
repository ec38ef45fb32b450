#pragma once

#include <istream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace redirector {

// Public Suffix List (https://publicsuffix.org/list/) rule set.
// Used to find the registrable "apex" of a certificate cache key.
class PublicSuffixList {
public:
    static constexpr const char* DEFAULT_PATH = "/usr/share/publicsuffix/public_suffix_list.dat";

    PublicSuffixList() = default;

    /**
     * Loads rules from a PSL data file.
     * @throws ConfigError if the file is unreadable or holds no rules. Without
     *         the list every subdomain would count as its own apex.
     */
    static PublicSuffixList load(const std::string& path);

    static PublicSuffixList parse(std::istream& in);

    void add_rule(const std::string& rule);

    // Public suffix of `domain` (at least its last label).
    std::string public_suffix(const std::string& domain) const;

    /**
     * Effective TLD plus one label, e.g. "example.co.uk" for "www.example.co.uk".
     * @return Nothing for empty names, names with empty labels, or names that
     *         are themselves a public suffix (e.g. "com", "acme_account+key").
     */
    std::optional<std::string> registrable_domain(const std::string& domain) const;

    size_t rule_count() const { return rules_.size() + wildcards_.size() + exceptions_.size(); }

private:
    static std::vector<std::string> split_labels(const std::string& domain);
    static std::string join_labels(const std::vector<std::string>& labels, size_t from);

    // Number of labels in the public suffix of `labels`.
    size_t suffix_label_count(const std::vector<std::string>& labels) const;

    std::unordered_set<std::string> rules_;
    std::unordered_set<std::string> wildcards_;   // "*.ck" stored as "ck"
    std::unordered_set<std::string> exceptions_;  // "!www.ck" stored as "www.ck"
};

} // namespace redirector
