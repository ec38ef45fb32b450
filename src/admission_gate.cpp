#include "admission_gate.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "rule_parser.hpp"
#include "server_logger.hpp"

namespace redirector {

AdmissionGate::AdmissionGate(TxtLookup& lookup)
    : lookup_(lookup)
{}

AdmissionResult AdmissionGate::check(const std::string& host, const RequestContext& ctx) const {
    const std::string name = redirect_record_name(host);
    AdmissionResult result{false, DenyReason::NONE, ""};

    std::vector<std::string> records;
    try {
        records = lookup_.lookup_txt(name, ctx);
    } catch (const DnsLookupError& e) {
        result.reason = DenyReason::DNS_FAILURE;
        result.detail = std::string("DNS lookup failed for ") + name + ": " + e.what();
    } catch (const OperationCancelledError& e) {
        result.reason = DenyReason::CANCELLED;
        result.detail = e.what();
    }

    if (result.reason == DenyReason::NONE) {
        for (const auto& record : records) {
            if (RuleParser::parse(record)) {
                result.allowed = true;
                break;
            }
        }
        if (!result.allowed) {
            result.reason = DenyReason::NO_VALID_RULE;
            result.detail = "no valid redirect config in TXT records for " + name;
        }
    }

    if (result.allowed) {
        MetricsRegistry::instance().increment_counter("cert_admission_allowed_total");
    } else {
        MetricsRegistry::instance().increment_counter("cert_admission_denied_total");
        ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::CERT_ADMISSION,
                          "internal", "Certificate denied for " + host + ": " + result.detail);
    }
    return result;
}

const char* AdmissionGate::reason_to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::NONE: return "none";
        case DenyReason::DNS_FAILURE: return "dns_failure";
        case DenyReason::NO_VALID_RULE: return "no_valid_rule";
        case DenyReason::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

} // namespace redirector
