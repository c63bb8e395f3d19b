#pragma once
#include <string>
#include <openssl/ssl.h>
#include <openssl/err.h>

#include "core/ssl_raii.h"

enum class TlsVerifyMode {
    Verify,     // system trust store + host name check
    NoVerify    // handshake only, certificate facts still readable
};

// Process-wide client contexts. SSL_CTX is safe to share across threads once
// configured, so both contexts are built on first use and never mutated.
class TlsContext {
public:
    static TlsContext& instance();

    SSL_CTX* client(TlsVerifyMode mode);

    // New SSL bound to fd with SNI set; with Verify the peer name must match host.
    SslPtr createClientSSL(int fd, const std::string& host, TlsVerifyMode mode);

    static std::string lastError();

private:
    TlsContext();
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SslCtxPtr verifying_;
    SslCtxPtr permissive_;
};
