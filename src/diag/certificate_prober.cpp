#include "diag/certificate_prober.h"
#include "net/tcp_socket.h"
#include "net/tls_context.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/ssl_raii.h"
#include "monitoring/metrics.h"

#include <map>
#include <openssl/asn1.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

/* ===================== X509 helpers ===================== */

// Attribute long name -> value ("organizationName" -> "Let's Encrypt")
static std::map<std::string, std::string> nameAttributes(X509_NAME* name) {
    std::map<std::string, std::string> out;
    if (!name) return out;

    int count = X509_NAME_entry_count(name);
    for (int i = 0; i < count; ++i) {
        X509_NAME_ENTRY* e = X509_NAME_get_entry(name, i);
        ASN1_OBJECT* obj = X509_NAME_ENTRY_get_object(e);
        ASN1_STRING* data = X509_NAME_ENTRY_get_data(e);

        const char* ln = OBJ_nid2ln(OBJ_obj2nid(obj));
        char oidBuf[80];
        if (!ln) {
            OBJ_obj2txt(oidBuf, sizeof(oidBuf), obj, 1);
            ln = oidBuf;
        }

        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len < 0) continue;
        out[ln] = std::string(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
        OPENSSL_free(utf8);
    }
    return out;
}

static std::optional<std::string> attr(const std::map<std::string, std::string>& m,
                                       const char* key) {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

static std::string asn1TimeText(const ASN1_TIME* t) {
    if (!t) return "";
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || ASN1_TIME_print(bio.get(), t) != 1)
        return "";
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

CertificateSummary CertificateProber::summarize(X509* cert, const std::string& freeCaMarker) {
    CertificateSummary s;
    if (!cert) return s;
    s.certificateSeen = true;

    auto issuer = nameAttributes(X509_get_issuer_name(cert));
    auto subject = nameAttributes(X509_get_subject_name(cert));

    s.issuerCountry = attr(issuer, "countryName");
    s.issuerOrg = attr(issuer, "organizationName");
    s.issuerCommonName = attr(issuer, "commonName");

    // "%b %d %H:%M:%S %Y %Z"
    std::string notAfter = asn1TimeText(X509_get0_notAfter(cert));
    if (!notAfter.empty()) {
        s.notAfter = parseCertTimestamp(notAfter);
        if (!s.notAfter)
            s.notAfterRaw = notAfter;
    }

    s.isSelfSigned = !issuer.empty() && !subject.empty() && issuer == subject;

    auto contains = [&](const std::optional<std::string>& v) {
        return v && v->find(freeCaMarker) != std::string::npos;
    };
    s.isLetsEncrypt = !freeCaMarker.empty() &&
        (contains(s.issuerCommonName) || contains(s.issuerOrg));

    return s;
}

/* ===================== Probe ===================== */

CertificateProber::CertificateProber(int timeoutSeconds, std::string freeCaMarker)
    : timeoutSeconds_(timeoutSeconds), freeCaMarker_(std::move(freeCaMarker)) {}

bool CertificateProber::handshake(const std::string& host, int port, bool verify,
                                  CertificateSummary& out) {
    auto mode = verify ? TlsVerifyMode::Verify : TlsVerifyMode::NoVerify;
    const char* phase = verify ? "verified" : "unverified";

    try {
        TcpSocket sock = TcpSocket::connect(host, port, timeoutSeconds_);
        SslPtr ssl = TlsContext::instance().createClientSSL(sock.fd(), host, mode);

        if (SSL_connect(ssl.get()) != 1) {
            std::string err = TlsContext::lastError();
            if (verify) {
                long vr = SSL_get_verify_result(ssl.get());
                if (vr != X509_V_OK)
                    err = X509_verify_cert_error_string(vr);
            }
            Logger::instance().log(LogLevel::Info,
                std::string("TLS: ") + phase + " handshake with " + host + " failed: " + err);
            return false;
        }

        if (verify && SSL_get_verify_result(ssl.get()) != X509_V_OK) {
            Logger::instance().log(LogLevel::Info, "TLS: certificate for " + host + " did not verify");
            return false;
        }

        X509Ptr peer(SSL_get_peer_certificate(ssl.get()));
        out = summarize(peer.get(), freeCaMarker_);
        SSL_shutdown(ssl.get());
        return true;
    } catch (const NetworkError& ex) {
        Logger::instance().log(LogLevel::Info,
            std::string("TLS: ") + phase + " probe of " + host + " failed: " + ex.what());
        return false;
    }
}

CertificateSummary CertificateProber::probe(const std::string& host, int port) {
    Metrics::instance().inc("probe_tls_total");

    CertificateSummary summary;
    if (handshake(host, port, true, summary)) {
        summary.tlsValid = true;
        return summary;
    }

    CertificateSummary fallback;
    if (handshake(host, port, false, fallback)) {
        fallback.tlsValid = false;
        return fallback;
    }

    Metrics::instance().inc("probe_tls_errors_total");
    Logger::instance().log(LogLevel::Warn, "TLS: no handshake possible with " + host);
    return CertificateSummary{};
}
