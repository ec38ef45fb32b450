#pragma once

#include <string>

#include "request_context.hpp"

namespace redirector {


// Abstract interface for persistent storage of certificate material.
// Keys are either domain names (certificate bundles) or opaque identifiers
// such as ACME account keys and HTTP-01 challenge tokens ("<token>+http-01").
class CertCache {
public:
    virtual ~CertCache() = default;

    /**
     * Retrieves the data stored under `key`.
     * @throws CacheMissError if nothing is stored under `key`.
     * @throws StoreError on backend failure.
     */
    virtual std::string get(const std::string& key, const RequestContext& ctx) = 0;

    /**
     * Persistently stores `data` under `key`, replacing any previous value.
     * @throws StoreError on backend failure, OperationCancelledError if `ctx`
     *         is done before the write became visible.
     */
    virtual void put(const std::string& key, const std::string& data, const RequestContext& ctx) = 0;

    // Deleting an absent key is not an error.
    virtual void remove(const std::string& key, const RequestContext& ctx) = 0;
};

}
