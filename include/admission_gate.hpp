#pragma once

#include <string>

#include "request_context.hpp"
#include "txt_lookup.hpp"

namespace redirector {

enum class DenyReason {
    NONE,
    DNS_FAILURE,
    NO_VALID_RULE,
    CANCELLED
};

struct AdmissionResult {
    bool allowed;
    DenyReason reason;
    std::string detail;
};

// Decides whether a certificate may be issued or renewed for a host name.
// A host qualifies as soon as one of its `_redirect` TXT records parses as a
// rule, whether or not that rule would ever match a request.
class AdmissionGate {
public:
    explicit AdmissionGate(TxtLookup& lookup);

    AdmissionResult check(const std::string& host, const RequestContext& ctx) const;

    static const char* reason_to_string(DenyReason reason);

private:
    TxtLookup& lookup_;
};

} // namespace redirector
