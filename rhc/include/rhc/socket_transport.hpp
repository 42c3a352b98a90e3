/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "rhc/client_config.hpp"
#include "rhc/transport.hpp"

namespace rhc {

namespace internal { class TlsClientContext; }

// HTTP/1.1 over POSIX TCP, TLS via OpenSSL. One connection per exchange
// ("Connection: close"); bodies framed by Content-Length, chunked encoding,
// or connection close.
class SocketTransport : public Transport {
public:
    explicit SocketTransport(const ClientConfig& cfg);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    std::unique_ptr<Exchange> open(const ConnectionConfig& conn, const OutboundRequest& req) override;

private:
    std::shared_ptr<internal::TlsClientContext> tls_context(bool verify_peer, const std::string& ca_file);

    ClientConfig _cfg;
    std::mutex _mtx;
    std::map<std::pair<bool, std::string>, std::shared_ptr<internal::TlsClientContext>> _tls;
};

} // namespace rhc
