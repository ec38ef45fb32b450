#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "cert_cache.hpp"

namespace redirector {

// Redis-backed certificate store so several instances can share issued
// certificates, account keys and challenge tokens.
class RedisCertCache : public CertCache {
public:
    static constexpr const char* DEFAULT_PREFIX = "redirector:cert:";

    explicit RedisCertCache(const std::string& redis_url, std::string prefix = DEFAULT_PREFIX);
    ~RedisCertCache() override = default;

    std::string get(const std::string& key, const RequestContext& ctx) override;
    void put(const std::string& key, const std::string& data, const RequestContext& ctx) override;
    void remove(const std::string& key, const RequestContext& ctx) override;

    // Connection health check.
    bool is_connected() const { return connected_; }

private:
    std::string storage_key(const std::string& key) const { return prefix_ + key; }
    sw::redis::Redis& client();

    std::unique_ptr<sw::redis::Redis> redis_;
    std::string prefix_;
    std::atomic<bool> connected_{false};
};

} // namespace redirector
