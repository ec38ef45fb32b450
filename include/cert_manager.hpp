#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/ssl.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "admission_gate.hpp"
#include "cert_cache.hpp"
#include "cert_issuer.hpp"
#include "errors.hpp"

namespace redirector {

// A parsed certificate bundle ready to be handed to a TLS handshake.
struct LoadedCertificate {
    std::shared_ptr<SSL_CTX> ctx;
    std::chrono::system_clock::time_point not_after;
};

// Selects (and when needed obtains) the certificate for each TLS handshake
// by SNI server name. Certificates come from the store first; new ones are
// only requested for hosts the admission gate allows, and are written back
// through the store so the weekly quota applies.
class CertManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::hours RENEW_BEFORE{24 * 30};
    // Backoff after a failed request to the CA, and after a quota refusal.
    static constexpr std::chrono::hours RETRY_INTERVAL{1};
    static constexpr std::chrono::hours QUOTA_RETRY_INTERVAL{24};
    static constexpr std::chrono::seconds ISSUE_TIMEOUT{180};
    // Host table size at which idle entries without a certificate are dropped.
    static constexpr size_t SWEEP_THRESHOLD = 1024;

    // `issuer` may be null: stored certificates are served, nothing is issued.
    CertManager(CertCache& cache, const AdmissionGate& gate, CertificateIssuer* issuer,
                Clock clock = [] { return std::chrono::system_clock::now(); });

    CertManager(const CertManager&) = delete;
    CertManager& operator=(const CertManager&) = delete;

    // Installs the SNI callback on the listener's TLS context.
    void attach(boost::asio::ssl::context& ctx);

    /**
     * Returns the TLS context for `host`, loading or issuing the certificate as needed.
     * @throws IssuanceError, RateLimitExceededError, StoreError or
     *         OperationCancelledError when no usable certificate is available.
     */
    std::shared_ptr<SSL_CTX> context_for(const std::string& host);

    /**
     * Parses a PEM bundle (private key and certificate chain, leaf first).
     * @return Nothing if the bundle is malformed, the key does not match,
     *         the leaf has expired at `now`, or it does not cover `host`.
     */
    static std::optional<LoadedCertificate> load_bundle(const std::string& pem, const std::string& host,
                                                        std::chrono::system_clock::time_point now);

    // Hosts with in-memory state (a certificate or a pending backoff).
    size_t tracked_hosts();

private:
    struct HostEntry {
        std::mutex mutex;  // serializes loading and issuance for the host
        std::optional<LoadedCertificate> cert;
        std::optional<std::chrono::steady_clock::time_point> retry_after;
        std::string last_error;
    };

    static int servername_callback(SSL* ssl, int* alert, void* arg);

    std::shared_ptr<HostEntry> entry_for(const std::string& host);
    void forget(const std::string& host, const std::shared_ptr<HostEntry>& entry);
    void sweep_locked();
    void load_from_cache(HostEntry& entry, const std::string& host);
    void admit(const std::string& host, const RequestContext& ctx);
    void obtain(HostEntry& entry, const std::string& host, const RequestContext& ctx);
    void record_failure(HostEntry& entry, const std::string& host, const RedirectError& e,
                        std::chrono::steady_clock::duration backoff);

    CertCache& cache_;
    const AdmissionGate& gate_;
    CertificateIssuer* issuer_;
    Clock clock_;

    std::mutex hosts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<HostEntry>> hosts_;
};

} // namespace redirector
