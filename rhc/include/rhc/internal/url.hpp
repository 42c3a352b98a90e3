/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace rhc::internal {

struct ParsedUrl {
    std::string protocol;               // lower-case scheme with colon, "https:"
    std::string hostname;               // lower-case, IPv6 without brackets
    std::optional<std::uint16_t> port;  // absent when omitted or equal to the scheme default
    std::string path;                   // path + query, "/" when empty; fragment dropped
};

// nullopt when s is not an absolute URL (no scheme, empty http(s) host, bad port).
std::optional<ParsedUrl> parse_url(const std::string& s);

} // namespace rhc::internal
