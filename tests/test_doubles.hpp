#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "cert_cache.hpp"
#include "cert_issuer.hpp"
#include "errors.hpp"
#include "txt_lookup.hpp"

namespace redirector {
namespace testing {

// In-memory TXT zone. Unknown names fail like NXDOMAIN.
class StubTxtLookup : public TxtLookup {
public:
    void set(const std::string& name, std::vector<std::string> records) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[name] = std::move(records);
    }

    void fail(const std::string& name, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[name] = reason;
    }

    // Lookups of `name` throw something no caller expects.
    void crash(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        crashes_.insert(name);
    }

    std::vector<std::string> lookup_txt(const std::string& name, const RequestContext& ctx) override {
        ctx.check();
        ++calls;
        std::lock_guard<std::mutex> lock(mutex_);
        last_name = name;
        if (crashes_.count(name)) throw std::logic_error("resolver bug for " + name);
        auto f = failures_.find(name);
        if (f != failures_.end()) throw DnsLookupError(name, f->second);
        auto it = records_.find(name);
        if (it == records_.end() || it->second.empty()) throw DnsLookupError(name, "no such host");
        return it->second;
    }

    std::atomic<int> calls{0};
    std::string last_name;

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> records_;
    std::map<std::string, std::string> failures_;
    std::set<std::string> crashes_;
};

// Map-backed store with switchable failures.
class MemoryCertCache : public CertCache {
public:
    std::string get(const std::string& key, const RequestContext& ctx) override {
        ctx.check();
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_gets) throw StoreError("backend down");
        auto it = data_.find(key);
        if (it == data_.end()) throw CacheMissError(key);
        return it->second;
    }

    void put(const std::string& key, const std::string& data, const RequestContext& ctx) override {
        ctx.check();
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_puts) throw StoreError("disk full");
        data_[key] = data;
        ++puts;
    }

    void remove(const std::string& key, const RequestContext& ctx) override {
        ctx.check();
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key);
    }

    bool contains(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.count(key) > 0;
    }

    std::atomic<bool> fail_puts{false};
    std::atomic<bool> fail_gets{false};
    std::atomic<int> puts{0};

private:
    std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

/**
 * Self-signed P-256 certificate for `host` as a PEM bundle (key, then cert).
 * @param valid_for_sec Lifetime from now; negative yields an expired certificate.
 */
inline std::string make_pem_bundle(const std::string& host, long valid_for_sec) {
    EVP_PKEY* key = nullptr;
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    EVP_PKEY_keygen_init(kctx);
    EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx, NID_X9_62_prime256v1);
    EVP_PKEY_keygen(kctx, &key);
    EVP_PKEY_CTX_free(kctx);

    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    long not_before = valid_for_sec < 0 ? valid_for_sec - 3600 : -3600;
    X509_gmtime_adj(X509_getm_notBefore(cert), not_before);
    X509_gmtime_adj(X509_getm_notAfter(cert), valid_for_sec);
    X509_set_pubkey(cert, key);

    X509_NAME* name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(host.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert, name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
    std::string san = "DNS:" + host;
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name, san.c_str());
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);

    X509_sign(cert, key, EVP_sha256());

    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
    PEM_write_bio_X509(bio, cert);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));

    BIO_free(bio);
    X509_free(cert);
    EVP_PKEY_free(key);
    return pem;
}

// Issues self-signed certificates, or fails on demand.
class FakeIssuer : public CertificateIssuer {
public:
    std::string issue(const std::string& host, const RequestContext& ctx) override {
        ctx.check();
        ++calls;
        if (fail) throw IssuanceError("CA unavailable");
        return make_pem_bundle(host, validity_sec);
    }

    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
    long validity_sec = 90L * 24 * 3600;
};

} // namespace testing
} // namespace redirector
