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
#include <optional>
#include <string>
#include <variant>
#include "rhc/transport.hpp"
#include "rhc/types.hpp"

namespace rhc {

// Raw string is written as-is; FormData is form-urlencoded first.
using RequestBody = std::variant<std::string, FormData>;

// Per-call configuration. Never modified by the client.
struct RequestOptions {
    // Client: full URL with scheme ("https://api.example.com[:port]").
    // LegacyClient: plain host name; `hostname` wins over `host` when both are set.
    std::string host;
    std::string hostname;
    std::optional<std::uint16_t> port;
    std::string path;                       // empty: "/" (Client: the URL's own path)
    Headers headers;

    std::optional<std::chrono::milliseconds> timeout;   // inactivity bound, absent = none
    unsigned max_retries = 0;
    std::chrono::milliseconds retry_delay{0};

    // Optional caller-side TLS agent settings; a fingerprint augments a copy of it.
    std::optional<TlsAgentOptions> agent;
};

} // namespace rhc
