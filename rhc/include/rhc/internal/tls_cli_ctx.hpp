/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "rhc/transport.hpp"

namespace rhc::internal {

// Minimal TLS client context. Loads system CA or custom CA and sets the
// chain verification mode.
class TlsClientContext {
public:
    TlsClientContext(bool verify_peer, const std::string& ca_file);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify_peer() const { return _verify_peer; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify_peer = true;
};

// Drain OpenSSL error stack into logs.
void log_openssl_errors(const char* where);

// SHA-256 and SHA-1 digests plus subject of the handshake peer certificate.
// Returns false when the peer presented no certificate.
bool read_peer_certificate(SSL* ssl, PeerCertificate& out);

} // namespace rhc::internal
