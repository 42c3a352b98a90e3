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
#include <vector>
#include "rhc/http_response.hpp"

namespace rhc::internal {

enum class ContentClass { Json, Binary, Text };

// Classifies a response by its Content-Type and converts the buffered body.
class ContentDecoder {
public:
    ContentDecoder(std::vector<std::string> binary_types, std::vector<std::string> binary_prefixes);

    // "application/json*" (case-insensitive) -> Json; exact binary type or
    // binary prefix -> Binary; anything else, including "", -> Text.
    ContentClass classify(const std::string& content_type) const;

    // nullopt for an empty body. Throws DecodeError on malformed JSON.
    std::optional<DecodedBody> decode(const std::string& bytes, const std::string& content_type) const;

private:
    std::vector<std::string> _binary_types;
    std::vector<std::string> _binary_prefixes;
};

} // namespace rhc::internal
