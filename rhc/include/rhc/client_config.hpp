/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace rhc {

// Public client configuration. Per-instance, immutable once the client is built.
struct ClientConfig {
    // Content decoding: exact binary types and binary prefixes
    std::vector<std::string> binary_mime_types    = {"application/pdf", "application/p7s"};
    std::vector<std::string> binary_mime_prefixes = {"image/"};

    // Used for connect when the request itself carries no timeout (0 = OS default)
    int connect_timeout_ms = 0;

    std::string user_agent = "rhc-client/1";
    std::size_t max_header_bytes = 1u << 20;

    // TLS
    bool tls_verify_peer = true;       // verify server certificate chain
    std::string tls_ca_file;           // optional CA file path
    std::string tls_sni;               // optional SNI servername override

    // Logging
    std::string log_file = "client.log";
};

} // namespace rhc
