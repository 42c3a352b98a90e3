/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "rhc/types.hpp"

namespace rhc {

// Body converted by declared content type: parsed JSON, opaque bytes, or text.
using DecodedBody = std::variant<nlohmann::json, Bytes, std::string>;

struct Response {
    int status_code = 0;
    std::string status_message;
    Headers headers;                   // names lower-cased
    std::optional<DecodedBody> data;   // absent when the body was empty

    // Originating request
    Method method = Method::Get;
    std::string url;
    unsigned attempts = 0;

    bool has_json() const { return data && std::holds_alternative<nlohmann::json>(*data); }
    bool has_bytes() const { return data && std::holds_alternative<Bytes>(*data); }
    bool has_text() const { return data && std::holds_alternative<std::string>(*data); }

    const nlohmann::json& json() const { return std::get<nlohmann::json>(*data); }
    const Bytes& bytes() const { return std::get<Bytes>(*data); }
    const std::string& text() const { return std::get<std::string>(*data); }
};

inline bool is_success_status(int code) { return code >= 200 && code <= 299; }

} // namespace rhc
