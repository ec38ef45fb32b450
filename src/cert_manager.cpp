#include "cert_manager.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "server_logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <vector>

namespace redirector {

namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

BioPtr memory_bio(const std::string& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
}

std::optional<std::chrono::system_clock::time_point> to_time_point(const ASN1_TIME* t) {
    struct tm tm_val{};
    if (!t || ASN1_TIME_to_tm(t, &tm_val) != 1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(timegm(&tm_val));
}

std::string normalize_host(const std::string& host) {
    std::string out = host;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

// Same protocol floor and cipher policy as the listener's base context.
void apply_tls_policy(SSL_CTX* ctx) {
    SSL_CTX_set_options(ctx, SSL_OP_CIPHER_SERVER_PREFERENCE | SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_cipher_list(ctx,
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );
}

} // namespace

CertManager::CertManager(CertCache& cache, const AdmissionGate& gate, CertificateIssuer* issuer, Clock clock)
    : cache_(cache)
    , gate_(gate)
    , issuer_(issuer)
    , clock_(std::move(clock))
{}

void CertManager::attach(boost::asio::ssl::context& ctx) {
    SSL_CTX_set_tlsext_servername_callback(ctx.native_handle(), &CertManager::servername_callback);
    SSL_CTX_set_tlsext_servername_arg(ctx.native_handle(), this);
}

int CertManager::servername_callback(SSL* ssl, int* alert, void* arg) {
    auto* self = static_cast<CertManager*>(arg);
    const char* name = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
    if (!name || !*name) {
        *alert = SSL_AD_UNRECOGNIZED_NAME;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }

    try {
        auto ctx = self->context_for(name);
        SSL_set_SSL_CTX(ssl, ctx.get());
        return SSL_TLSEXT_ERR_OK;
    } catch (const std::exception& e) {
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::CERT_ISSUANCE, "internal",
                          std::string("No certificate for ") + name + ": " + e.what());
        *alert = SSL_AD_INTERNAL_ERROR;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
}

std::optional<LoadedCertificate> CertManager::load_bundle(const std::string& pem, const std::string& host,
                                                          std::chrono::system_clock::time_point now) {
    auto key_bio = memory_bio(pem);
    if (!key_bio) return std::nullopt;
    PkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key) {
        ERR_clear_error();
        return std::nullopt;
    }

    auto cert_bio = memory_bio(pem);
    if (!cert_bio) return std::nullopt;
    std::vector<X509Ptr> chain;
    while (X509* x = PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr)) {
        chain.emplace_back(x, X509_free);
    }
    // Reading stops with a "no start line" error at the end of the data.
    ERR_clear_error();
    if (chain.empty()) return std::nullopt;

    X509* leaf = chain.front().get();
    auto not_after = to_time_point(X509_get0_notAfter(leaf));
    if (!not_after || *not_after <= now) return std::nullopt;

    std::string name = normalize_host(host);
    if (X509_check_host(leaf, name.data(), name.size(), 0, nullptr) != 1) return std::nullopt;

    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
    if (!ctx) return std::nullopt;
    apply_tls_policy(ctx.get());

    if (SSL_CTX_use_certificate(ctx.get(), leaf) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.get(), key.get()) != 1 ||
        SSL_CTX_check_private_key(ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    for (size_t i = 1; i < chain.size(); ++i) {
        if (SSL_CTX_add1_chain_cert(ctx.get(), chain[i].get()) != 1) {
            ERR_clear_error();
            return std::nullopt;
        }
    }

    return LoadedCertificate{std::move(ctx), *not_after};
}

std::shared_ptr<CertManager::HostEntry> CertManager::entry_for(const std::string& host) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    if (hosts_.size() >= SWEEP_THRESHOLD) {
        sweep_locked();
    }
    auto& entry = hosts_[host];
    if (!entry) entry = std::make_shared<HostEntry>();
    return entry;
}

void CertManager::forget(const std::string& host, const std::shared_ptr<HostEntry>& entry) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto it = hosts_.find(host);
    if (it != hosts_.end() && it->second == entry) {
        hosts_.erase(it);
    }
}

// Caller holds hosts_mutex_, so no new reference to an entry can appear.
void CertManager::sweep_locked() {
    auto wall_now = clock_();
    auto now = std::chrono::steady_clock::now();
    for (auto it = hosts_.begin(); it != hosts_.end();) {
        bool idle = false;
        if (it->second.use_count() == 1) {
            std::unique_lock<std::mutex> entry_lock(it->second->mutex, std::try_to_lock);
            if (entry_lock.owns_lock()) {
                const HostEntry& e = *it->second;
                bool has_cert = e.cert && e.cert->not_after > wall_now;
                bool backing_off = e.retry_after && now < *e.retry_after;
                idle = !has_cert && !backing_off;
            }
        }
        if (idle) {
            it = hosts_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CertManager::tracked_hosts() {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    return hosts_.size();
}

void CertManager::load_from_cache(HostEntry& entry, const std::string& host) {
    try {
        auto pem = cache_.get(host, RequestContext::with_timeout(std::chrono::seconds(10)));
        if (auto loaded = load_bundle(pem, host, clock_())) {
            entry.cert = std::move(loaded);
        } else {
            ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::CERT_ISSUANCE, "internal",
                              "Ignoring unusable stored certificate for " + host);
        }
    } catch (const CacheMissError&) {
        // Nothing stored yet
    } catch (const StoreError& e) {
        ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::STORE_FAILURE, "internal",
                          "Certificate load failed for " + host + ": " + e.what());
    }
}

void CertManager::admit(const std::string& host, const RequestContext& ctx) {
    if (!issuer_) {
        throw IssuanceError("no certificate issuer configured for " + host);
    }
    auto admission = gate_.check(host, ctx);
    if (!admission.allowed) {
        throw IssuanceError("certificate not allowed for " + host + ": " + admission.detail);
    }
}

void CertManager::obtain(HostEntry& entry, const std::string& host, const RequestContext& ctx) {
    std::string bundle = issuer_->issue(host, ctx);
    auto loaded = load_bundle(bundle, host, clock_());
    if (!loaded) {
        throw IssuanceError("issuer returned an unusable certificate for " + host);
    }

    cache_.put(host, bundle, ctx);

    entry.cert = std::move(loaded);
    MetricsRegistry::instance().increment_counter("cert_issued_total");
    ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::CERT_ISSUANCE, "internal",
                      "Certificate issued for " + host);
}

void CertManager::record_failure(HostEntry& entry, const std::string& host, const RedirectError& e,
                                 std::chrono::steady_clock::duration backoff) {
    MetricsRegistry::instance().increment_counter("cert_issue_failed_total");
    ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::CERT_ISSUANCE, "internal",
                      "Certificate for " + host + " not obtained: " + e.what());
    entry.retry_after = std::chrono::steady_clock::now() + backoff;
    entry.last_error = e.what();
}

std::shared_ptr<SSL_CTX> CertManager::context_for(const std::string& raw_host) {
    const std::string host = normalize_host(raw_host);
    if (host.empty()) {
        throw IssuanceError("missing server name");
    }

    auto entry = entry_for(host);
    std::unique_lock<std::mutex> lock(entry->mutex);

    auto now = clock_();
    if (entry->cert && entry->cert->not_after <= now) {
        entry->cert.reset();
    }
    if (!entry->cert) {
        load_from_cache(*entry, host);
    }
    if (entry->cert && entry->cert->not_after - now > RENEW_BEFORE) {
        return entry->cert->ctx;
    }

    // Inside the renewal window, or nothing usable: after a failure nothing
    // is requested again until the backoff has passed.
    if (entry->retry_after && std::chrono::steady_clock::now() < *entry->retry_after) {
        if (entry->cert) return entry->cert->ctx;
        throw IssuanceError("not retrying certificate for " + host + " yet: " + entry->last_error);
    }

    auto ctx = RequestContext::with_timeout(ISSUE_TIMEOUT);
    try {
        admit(host, ctx);
    } catch (const RedirectError& e) {
        // The CA was never contacted; a host without a certificate keeps no state.
        if (!entry->cert) {
            MetricsRegistry::instance().increment_counter("cert_issue_failed_total");
            ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::CERT_ISSUANCE, "internal",
                              "Certificate for " + host + " not obtained: " + e.what());
            lock.unlock();
            forget(host, entry);
            throw;
        }
        record_failure(*entry, host, e, RETRY_INTERVAL);
        return entry->cert->ctx;
    }

    try {
        obtain(*entry, host, ctx);
        entry->retry_after.reset();
        entry->last_error.clear();
    } catch (const RateLimitExceededError& e) {
        record_failure(*entry, host, e, QUOTA_RETRY_INTERVAL);
        if (!entry->cert) throw;
    } catch (const RedirectError& e) {
        record_failure(*entry, host, e, RETRY_INTERVAL);
        if (!entry->cert) throw;
    }
    return entry->cert->ctx;
}

} // namespace redirector
