#include "net/tls_context.h"
#include "core/errors.h"
#include "core/logger.h"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

TlsContext& TlsContext::instance() {
    static TlsContext t;
    return t;
}

static SslCtxPtr makeClientCtx(bool verify) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
        throw NetworkError("SSL_CTX_new failed: " + TlsContext::lastError());

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_VERSION);
    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);

    if (verify) {
        if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
            Logger::instance().log(LogLevel::Warn,
                "TLS: could not load system trust store: " + TlsContext::lastError());
        }
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }
    return ctx;
}

TlsContext::TlsContext()
    : verifying_(makeClientCtx(true))
    , permissive_(makeClientCtx(false)) {
    Logger::instance().log(LogLevel::Debug, "TLS client contexts initialized");
}

SSL_CTX* TlsContext::client(TlsVerifyMode mode) {
    return mode == TlsVerifyMode::Verify ? verifying_.get() : permissive_.get();
}

SslPtr TlsContext::createClientSSL(int fd, const std::string& host, TlsVerifyMode mode) {
    SslPtr ssl = make_ssl_ptr(SSL_new(client(mode)));
    if (!ssl)
        throw NetworkError("SSL_new failed: " + lastError());

    SSL_set_fd(ssl.get(), fd);
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());

    if (mode == TlsVerifyMode::Verify) {
        SSL_set_hostflags(ssl.get(), X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (SSL_set1_host(ssl.get(), host.c_str()) != 1)
            throw NetworkError("SSL_set1_host failed for " + host);
    }
    return ssl;
}

std::string TlsContext::lastError() {
    unsigned long code = ERR_get_error();
    if (code == 0)
        return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}
