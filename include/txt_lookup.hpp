#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "request_context.hpp"

namespace redirector {

// DNS TXT query capability used by the redirect handler and the admission gate.
class TxtLookup {
public:
    virtual ~TxtLookup() = default;

    /**
     * Fetches the TXT records published at `name`.
     * @return Record strings in answer order. Character-strings within one
     *         record are joined.
     * @throws DnsLookupError on NXDOMAIN, an empty answer, or resolver failure.
     * @throws OperationCancelledError if `ctx` is done before the query is sent.
     */
    virtual std::vector<std::string> lookup_txt(const std::string& name, const RequestContext& ctx) = 0;
};

// Blocking lookup through the system resolver (libresolv).
// Each call uses its own resolver state, so instances are safe to share across threads.
class SystemTxtLookup : public TxtLookup {
public:
    explicit SystemTxtLookup(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    std::vector<std::string> lookup_txt(const std::string& name, const RequestContext& ctx) override;

    // Splits the RDATA of one TXT record into its length-prefixed strings and joins them.
    static std::string decode_txt_rdata(const unsigned char* rdata, size_t length);

private:
    std::chrono::milliseconds timeout_;
};

// Name of the TXT record holding redirect rules for `host`.
inline std::string redirect_record_name(const std::string& host) {
    return "_redirect." + host;
}

} // namespace redirector
