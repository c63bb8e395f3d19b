#pragma once

#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <memory>

struct SSLDeleter {
    void operator()(SSL* s) const noexcept {
        if (s) SSL_free(s);
    }
};

struct SSLCtxDeleter {
    void operator()(SSL_CTX* c) const noexcept {
        if (c) SSL_CTX_free(c);
    }
};

struct X509Deleter {
    void operator()(X509* x) const noexcept {
        if (x) X509_free(x);
    }
};

struct BIODeleter {
    void operator()(BIO* b) const noexcept {
        if (b) BIO_free(b);
    }
};

using SslPtr = std::unique_ptr<SSL, SSLDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SSLCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BIODeleter>;

inline SslPtr make_ssl_ptr(SSL* raw) {
    return SslPtr(raw);
}
