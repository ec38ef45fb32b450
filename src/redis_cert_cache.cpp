#include "redis_cert_cache.hpp"
#include "errors.hpp"
#include "server_logger.hpp"

namespace redirector {

RedisCertCache::RedisCertCache(const std::string& redis_url, std::string prefix)
    : prefix_(std::move(prefix)) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;
        ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::LIFECYCLE, "internal",
                          "Certificate store connected to Redis");
    } catch (const sw::redis::Error& e) {
        // Commands retry the connection; stay usable so a later restart of
        // Redis does not require restarting the server.
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::STORE_FAILURE, "internal",
                          std::string("Redis connection failed: ") + e.what());
        connected_ = false;
    }
}

sw::redis::Redis& RedisCertCache::client() {
    if (!redis_) {
        throw StoreError("redis client not initialized");
    }
    return *redis_;
}

std::string RedisCertCache::get(const std::string& key, const RequestContext& ctx) {
    ctx.check();
    try {
        auto value = client().get(storage_key(key));
        connected_ = true;
        if (!value) {
            throw CacheMissError(key);
        }
        return *value;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis get failed: ") + e.what());
    }
}

void RedisCertCache::put(const std::string& key, const std::string& data, const RequestContext& ctx) {
    ctx.check();
    try {
        if (!client().set(storage_key(key), data)) {
            throw StoreError("redis set rejected for " + key);
        }
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis set failed: ") + e.what());
    }
}

void RedisCertCache::remove(const std::string& key, const RequestContext& ctx) {
    ctx.check();
    try {
        client().del(storage_key(key));
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis del failed: ") + e.what());
    }
}

} // namespace redirector
