#pragma once
#include <string>
#include <openssl/x509.h>

#include "diag/diagnostic_types.h"

class ICertificateProber {
public:
    virtual ~ICertificateProber() = default;

    // Never throws; a host with no reachable TLS yields tlsValid=false and
    // no issuer facts.
    virtual CertificateSummary probe(const std::string& host, int port) = 0;
};

/**
 * Two-phase TLS probe.
 *
 * Phase one is a normal verifying handshake (trust store + host name). If it
 * fails for any reason, phase two repeats the handshake with verification
 * off, only to read issuer/subject facts; tlsValid stays false. Self-signed
 * and mismatched certificates are scored, so they must not vanish as plain
 * failures.
 */
class CertificateProber : public ICertificateProber {
public:
    CertificateProber(int timeoutSeconds, std::string freeCaMarker = "Let's Encrypt");

    CertificateSummary probe(const std::string& host, int port) override;

    // Issuer/subject facts of one certificate; tlsValid is left false.
    static CertificateSummary summarize(X509* cert, const std::string& freeCaMarker);

private:
    // true when a handshake completed; `out` gets the peer certificate facts
    bool handshake(const std::string& host, int port, bool verify, CertificateSummary& out);

    int timeoutSeconds_;
    std::string freeCaMarker_;
};
