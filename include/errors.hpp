#pragma once

#include <stdexcept>
#include <string>

namespace redirector {

// Base for every failure the redirect and certificate paths report to callers.
class RedirectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No rule in the record set translated the request path.
class NoMatchError : public RedirectError {
public:
    NoMatchError() : RedirectError("No paths matched") {}
};

// The TXT query itself failed (NXDOMAIN, empty answer, timeout, resolver error).
class DnsLookupError : public RedirectError {
public:
    DnsLookupError(const std::string& name, const std::string& reason)
        : RedirectError("lookup " + name + ": " + reason)
        , name_(name)
        , reason_(reason) {}

    const std::string& name() const { return name_; }
    const std::string& reason() const { return reason_; }

private:
    std::string name_;
    std::string reason_;
};

// Weekly certificate quota for an apex domain is used up.
class RateLimitExceededError : public RedirectError {
public:
    RateLimitExceededError(const std::string& apex, int issued)
        : RedirectError("rate limit exceeded: " + std::to_string(issued) +
                        " certs already issued for " + apex + " this week")
        , apex_(apex) {}

    const std::string& apex() const { return apex_; }

private:
    std::string apex_;
};

// Underlying certificate store failure.
class StoreError : public RedirectError {
public:
    using RedirectError::RedirectError;
};

// Key is not present in the certificate store.
class CacheMissError : public RedirectError {
public:
    explicit CacheMissError(const std::string& key)
        : RedirectError("cache miss: " + key) {}
};

class OperationCancelledError : public RedirectError {
public:
    explicit OperationCancelledError(const std::string& what = "operation cancelled")
        : RedirectError(what) {}
};

// External certificate issuer failed to produce a bundle.
class IssuanceError : public RedirectError {
public:
    using RedirectError::RedirectError;
};

} // namespace redirector
