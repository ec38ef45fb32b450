#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "cert_cache.hpp"
#include "public_suffix.hpp"

namespace redirector {


// Quota layer over a certificate store.
// Caps new certificates at `limit` per apex domain per week to stay well
// within CA rate limits. Counters live in memory only: they reset on
// restart and whenever the week bucket rolls over.
class RateLimitedCertCache : public CertCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int DEFAULT_CERTS_PER_WEEK = 2;
    static constexpr long long WEEK_SECONDS = 7LL * 24 * 60 * 60;
    // Seconds from 0001-01-01T00:00:00Z to the Unix epoch. Buckets are counted
    // from that instant, so each one starts on a Monday 00:00 UTC.
    static constexpr long long BUCKET_EPOCH_OFFSET = 62135596800LL;

    RateLimitedCertCache(std::unique_ptr<CertCache> inner,
                         const PublicSuffixList& suffixes,
                         int limit = DEFAULT_CERTS_PER_WEEK,
                         Clock clock = [] { return std::chrono::system_clock::now(); });
    ~RateLimitedCertCache() override = default;

    std::string get(const std::string& key, const RequestContext& ctx) override;

    /**
     * Stores `data`, charging the quota of the key's apex domain.
     * Keys that are not domain names (account keys, challenge tokens) bypass the quota.
     * @throws RateLimitExceededError when the apex has used its weekly quota;
     *         the underlying store is not touched.
     * @throws StoreError from the underlying store; no quota is consumed.
     */
    void put(const std::string& key, const std::string& data, const RequestContext& ctx) override;

    void remove(const std::string& key, const RequestContext& ctx) override;

    static long long week_bucket(std::chrono::system_clock::time_point t);

    int limit() const { return limit_; }

private:
    std::unique_ptr<CertCache> inner_;
    const PublicSuffixList& suffixes_;
    const int limit_;
    Clock clock_;

    std::mutex mutex_;  // guards counts_ and week_
    std::unordered_map<std::string, int> counts_;
    long long week_;
};

}
