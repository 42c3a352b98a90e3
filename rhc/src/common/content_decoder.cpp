/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/content_decoder.hpp"
#include "rhc/internal/utils.hpp"
#include "rhc/errors.hpp"
#include <algorithm>
#include <utility>

namespace rhc::internal {

ContentDecoder::ContentDecoder(std::vector<std::string> binary_types, std::vector<std::string> binary_prefixes)
    : _binary_types(std::move(binary_types)), _binary_prefixes(std::move(binary_prefixes)) {}

ContentClass ContentDecoder::classify(const std::string& content_type) const {
    if (content_type.empty()) return ContentClass::Text;
    if (starts_with_ci(content_type, "application/json")) return ContentClass::Json;

    if (std::find(_binary_types.begin(), _binary_types.end(), content_type) != _binary_types.end()) {
        return ContentClass::Binary;
    }
    for (const auto& prefix : _binary_prefixes) {
        if (content_type.compare(0, prefix.size(), prefix) == 0) return ContentClass::Binary;
    }
    return ContentClass::Text;
}

std::optional<DecodedBody> ContentDecoder::decode(const std::string& bytes, const std::string& content_type) const {
    if (bytes.empty()) return std::nullopt;

    switch (classify(content_type)) {
        case ContentClass::Json: {
            const std::string text = utf8_sanitize(bytes);
            try {
                return DecodedBody(std::in_place_type<nlohmann::json>, nlohmann::json::parse(text));
            } catch (const nlohmann::json::parse_error& e) {
                throw DecodeError(e.what(), bytes);
            }
        }
        case ContentClass::Binary:
            return DecodedBody(std::in_place_type<Bytes>, bytes.begin(), bytes.end());
        case ContentClass::Text:
            break;
    }
    return DecodedBody(std::in_place_type<std::string>, utf8_sanitize(bytes));
}

} // namespace rhc::internal
