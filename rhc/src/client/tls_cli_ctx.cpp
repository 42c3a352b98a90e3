/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/tls_cli_ctx.hpp"
#include "rhc/internal/utils.hpp"
#include "rhc/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace rhc::internal {

TlsClientContext::TlsClientContext(bool verify_peer, const std::string& ca_file)
    : _verify_peer(verify_peer)
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        log_openssl_errors("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_openssl_errors("set_min_proto");
    }

    // Trust store
    if (!ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, ca_file.c_str(), nullptr) != 1) {
            log_openssl_errors("load_verify_locations(CA)");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_openssl_errors("set_default_verify_paths");
        }
    }

    SSL_CTX_set_verify(_ctx, verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Close-delimited bodies: a peer that skips close_notify still ends the stream.
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void log_openssl_errors(const char* where) {
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        rhc::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

bool read_peer_certificate(SSL* ssl, PeerCertificate& out) {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    X509* cert = SSL_get1_peer_certificate(ssl);
#else
    X509* cert = SSL_get_peer_certificate(ssl);
#endif
    if (!cert) return false;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    out = PeerCertificate{};
    if (X509_digest(cert, EVP_sha256(), md, &len) == 1) {
        out.fingerprint256 = bytes_to_colon_hex(md, len);
    }
    len = 0;
    if (X509_digest(cert, EVP_sha1(), md, &len) == 1) {
        out.fingerprint = bytes_to_colon_hex(md, len);
    }

    char name[512];
    if (X509_NAME_oneline(X509_get_subject_name(cert), name, sizeof(name))) {
        out.subject = name;
    }

    X509_free(cert);
    return true;
}

} // namespace rhc::internal
