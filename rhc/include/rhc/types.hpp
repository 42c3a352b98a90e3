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
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rhc {

enum class Method {
    Get,
    Post,
    Put,
    Delete
};

enum class Scheme {
    Http,
    Https
};

// Header names as supplied by the caller on requests; lower-cased on responses.
using Headers = std::unordered_map<std::string, std::string>;

using Bytes = std::vector<std::uint8_t>;

// Ordered key/value list, keys may repeat ("a=1&a=2").
using FormData = std::vector<std::pair<std::string, std::string>>;

const char* method_name(Method m);
const char* scheme_name(Scheme s);   // "http:" / "https:"
std::uint16_t default_port(Scheme s);

} // namespace rhc
