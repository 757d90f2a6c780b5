#include "stoa/jobs/KTLSContextHelper.hpp"
#include "stoa/logger/Logger.hpp"
#include <openssl/err.h>

namespace stoa {

SslContextPtr KTLSContextHelper::createServerContext(const std::string& cert_path, const std::string& key_path) {
    Logger& logger = Logger::getInstance();

    if (OPENSSL_init_ssl(0, nullptr) != 1) {
        logger.logError("KTLSContextHelper: OpenSSL initialization failed: " + lastOpenSSLError());
        return nullptr;
    }

    SslContextPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) {
        logger.logError("KTLSContextHelper: cannot create SSL context: " + lastOpenSSLError());
        return nullptr;
    }

    SSL_CTX_set_options(ctx.get(), SSL_OP_ENABLE_KTLS);
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_max_proto_version(ctx.get(), TLS1_3_VERSION);

    // GCM suites are the ones the kernel can take over
    if (!SSL_CTX_set_cipher_list(ctx.get(), "ECDHE-RSA-AES128-GCM-SHA256:ECDHE-RSA-AES256-GCM-SHA384:"
                                      "ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-ECDSA-AES256-GCM-SHA384:"
                                      "HIGH:!aNULL:!eNULL:!EXPORT:!DES:!RC4:!MD5")) {
        logger.logError("KTLSContextHelper: cannot set cipher list: " + lastOpenSSLError());
        return nullptr;
    }

    if (!loadCertificates(ctx.get(), cert_path, key_path)) {
        return nullptr;
    }

    logger.logMessage("KTLSContextHelper: SSL context ready for " + cert_path);
    return ctx;
}

bool KTLSContextHelper::loadCertificates(SSL_CTX* ctx, const std::string& cert_path, const std::string& key_path) {
    Logger& logger = Logger::getInstance();

    if (SSL_CTX_use_certificate_chain_file(ctx, cert_path.c_str()) != 1) {
        logger.logError("KTLSContextHelper: cannot load certificate " + cert_path + ": " + lastOpenSSLError());
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
        logger.logError("KTLSContextHelper: cannot load private key " + key_path + ": " + lastOpenSSLError());
        return false;
    }
    if (!SSL_CTX_check_private_key(ctx)) {
        logger.logError("KTLSContextHelper: private key does not match the certificate");
        return false;
    }
    return true;
}

std::string KTLSContextHelper::lastOpenSSLError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

} // namespace stoa
