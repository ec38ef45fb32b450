#include "rate_limited_cert_cache.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "server_logger.hpp"

namespace redirector {

RateLimitedCertCache::RateLimitedCertCache(std::unique_ptr<CertCache> inner,
                                           const PublicSuffixList& suffixes,
                                           int limit,
                                           Clock clock)
    : inner_(std::move(inner))
    , suffixes_(suffixes)
    , limit_(limit)
    , clock_(std::move(clock))
    , week_(week_bucket(clock_()))
{}

long long RateLimitedCertCache::week_bucket(std::chrono::system_clock::time_point t) {
    long long unix_sec = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    return (unix_sec + BUCKET_EPOCH_OFFSET) / WEEK_SECONDS;
}

std::string RateLimitedCertCache::get(const std::string& key, const RequestContext& ctx) {
    return inner_->get(key, ctx);
}

void RateLimitedCertCache::remove(const std::string& key, const RequestContext& ctx) {
    inner_->remove(key, ctx);
}

void RateLimitedCertCache::put(const std::string& key, const std::string& data, const RequestContext& ctx) {
    auto apex = suffixes_.registrable_domain(key);
    if (!apex) {
        // Not a domain key (e.g. acme_account+key), no quota applies.
        inner_->put(key, data, ctx);
        MetricsRegistry::instance().increment_counter("cert_store_put_total");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ctx.check();

    long long week = week_bucket(clock_());
    if (week != week_) {
        counts_.clear();
        week_ = week;
    }

    int& count = counts_[*apex];
    if (count >= limit_) {
        MetricsRegistry::instance().increment_counter("cert_rate_limited_total");
        ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::RATE_LIMIT_HIT, "internal",
                          "Weekly certificate quota reached for " + *apex + ", refusing " + key);
        throw RateLimitExceededError(*apex, count);
    }

    inner_->put(key, data, ctx);
    ++count;
    MetricsRegistry::instance().increment_counter("cert_store_put_total");
}

}
