#pragma once

#include <chrono>
#include <string>

#include "request_context.hpp"

namespace redirector {

// Obtains a new certificate for a host from a certificate authority.
// The ACME exchange itself lives behind this interface.
class CertificateIssuer {
public:
    virtual ~CertificateIssuer() = default;

    /**
     * @return PEM bundle: private key followed by the certificate chain, leaf first.
     * @throws IssuanceError if no certificate could be obtained.
     */
    virtual std::string issue(const std::string& host, const RequestContext& ctx) = 0;
};

// Runs an external ACME client: `<command> <host>`, with
// REDIRECTOR_CHALLENGE_DIR pointing at the directory whose `<token>+http-01`
// files the HTTP listener serves. The bundle is read from the program's stdout.
class ExecCertificateIssuer : public CertificateIssuer {
public:
    ExecCertificateIssuer(std::string command, std::string challenge_dir,
                          std::chrono::seconds timeout = std::chrono::seconds(120));

    std::string issue(const std::string& host, const RequestContext& ctx) override;

private:
    std::string command_;
    std::string challenge_dir_;
    std::chrono::seconds timeout_;
};

} // namespace redirector
