#include "txt_lookup.hpp"
#include "errors.hpp"

#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <netdb.h>

#include <algorithm>
#include <cstring>

namespace redirector {

namespace {

// Owns a private resolver state for the duration of one query.
class ResolverState {
public:
    ResolverState() {
        std::memset(&state_, 0, sizeof(state_));
        initialized_ = (res_ninit(&state_) == 0);
    }

    ~ResolverState() {
        if (initialized_) res_nclose(&state_);
    }

    ResolverState(const ResolverState&) = delete;
    ResolverState& operator=(const ResolverState&) = delete;

    bool initialized() const { return initialized_; }
    res_state get() { return &state_; }

private:
    struct __res_state state_;
    bool initialized_ = false;
};

std::string describe_h_errno(int err) {
    switch (err) {
        case HOST_NOT_FOUND:
        case NO_DATA:
            return "no such host";
        case TRY_AGAIN:
            return "i/o timeout or temporary server failure";
        case NO_RECOVERY:
            return "server misbehaving";
        default:
            return "resolver error " + std::to_string(err);
    }
}

} // namespace

SystemTxtLookup::SystemTxtLookup(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{}

std::string SystemTxtLookup::decode_txt_rdata(const unsigned char* rdata, size_t length) {
    std::string out;
    size_t pos = 0;
    while (pos < length) {
        size_t chunk = rdata[pos++];
        if (pos + chunk > length) {
            chunk = length - pos;
        }
        out.append(reinterpret_cast<const char*>(rdata + pos), chunk);
        pos += chunk;
    }
    return out;
}

std::vector<std::string> SystemTxtLookup::lookup_txt(const std::string& name, const RequestContext& ctx) {
    ctx.check();

    ResolverState resolver;
    if (!resolver.initialized()) {
        throw DnsLookupError(name, "resolver initialization failed");
    }

    // Per-try timeout in whole seconds, bounded by the caller's deadline.
    auto per_try = std::chrono::duration_cast<std::chrono::seconds>(
        ctx.remaining(RequestContext::Clock::duration(timeout_)));
    resolver.get()->retrans = std::max<int>(1, static_cast<int>(per_try.count()));
    resolver.get()->retry = 1;

    std::vector<unsigned char> answer(NS_MAXMSG);
    int len = res_nquery(resolver.get(), name.c_str(), ns_c_in, ns_t_txt,
                         answer.data(), static_cast<int>(answer.size()));
    if (len < 0) {
        throw DnsLookupError(name, describe_h_errno(resolver.get()->res_h_errno));
    }

    ns_msg msg;
    if (ns_initparse(answer.data(), len, &msg) < 0) {
        throw DnsLookupError(name, "malformed DNS response");
    }

    std::vector<std::string> records;
    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
            throw DnsLookupError(name, "malformed DNS answer record");
        }
        // CNAME chains show up in the answer section ahead of the TXT data.
        if (ns_rr_type(rr) != ns_t_txt) continue;
        records.push_back(decode_txt_rdata(ns_rr_rdata(rr), ns_rr_rdlen(rr)));
    }

    if (records.empty()) {
        throw DnsLookupError(name, "no such host");
    }
    return records;
}

} // namespace redirector
