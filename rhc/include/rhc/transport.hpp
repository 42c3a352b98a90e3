/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "rhc/types.hpp"

namespace rhc {

// Peer certificate digests, colon-separated upper-case hex ("AB:CD:...").
struct PeerCertificate {
    std::string subject;
    std::string fingerprint256;   // SHA-256, empty if unavailable
    std::string fingerprint;      // SHA-1 (legacy)
};

// Called once per TLS handshake. Returns a rejection reason, or nullopt to accept.
using IdentityVerifier =
    std::function<std::optional<std::string>(const std::string& host, const PeerCertificate& cert)>;

// TLS agent settings attached to one connection.
struct TlsAgentOptions {
    std::optional<bool> verify_peer;      // overrides ClientConfig::tls_verify_peer when set
    std::string ca_file;                  // overrides ClientConfig::tls_ca_file when non-empty
    IdentityVerifier check_server_identity;  // replaces the default host-name check when set
};

// Effective connection configuration for one attempt.
struct ConnectionConfig {
    Scheme scheme = Scheme::Http;
    std::string host;
    std::uint16_t port = 80;
    std::optional<TlsAgentOptions> agent;
};

// Serialized request handed to the transport; the body is already encoded.
struct OutboundRequest {
    Method method = Method::Get;
    std::string path = "/";
    Headers headers;
    std::string body;
    std::optional<std::chrono::milliseconds> timeout;
};

struct TransportEvent {
    enum class Type {
        Response,   // status line + headers arrived
        Data,       // one body chunk
        End,        // body complete
        Error,      // connection-level failure, `detail` set
        Timeout,    // inactivity timeout expired
        Abort       // exchange aborted before any response
    };

    Type type = Type::Error;
    int status_code = 0;
    std::string status_message;
    Headers headers;
    std::string chunk;
    std::string detail;

    static TransportEvent response(int code, std::string message, Headers headers);
    static TransportEvent data(std::string chunk);
    static TransportEvent end();
    static TransportEvent error(std::string detail);
    static TransportEvent timeout();
    static TransportEvent abort();
};

// One in-flight request/response. next() blocks until the next event;
// after End, Error, Timeout or Abort no further events are produced.
class Exchange {
public:
    virtual ~Exchange() = default;
    virtual TransportEvent next() = 0;
};

// Transport primitive. open() validates and prepares the exchange and may throw;
// network failures are reported as events, never thrown.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::unique_ptr<Exchange> open(const ConnectionConfig& conn, const OutboundRequest& req) = 0;
};

} // namespace rhc
