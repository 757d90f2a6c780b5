#pragma once

#include <memory>
#include <openssl/ssl.h>
#include <string>

namespace stoa {

struct SslContextDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

using SslContextPtr = std::unique_ptr<SSL_CTX, SslContextDeleter>;

/**
 * Server SSL contexts the kernel can take over after the handshake:
 * TLS 1.2 or 1.3, AES-GCM suites preferred, SSL_OP_ENABLE_KTLS set.
 */
class KTLSContextHelper {
public:
    // empty on failure; the OpenSSL reason goes to the log
    static SslContextPtr createServerContext(const std::string& cert_path, const std::string& key_path);

private:
    static bool loadCertificates(SSL_CTX* ctx, const std::string& cert_path, const std::string& key_path);
    static std::string lastOpenSSLError();
};

} // namespace stoa
