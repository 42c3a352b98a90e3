/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>
#include "rhc/transport.hpp"
#include "rhc/types.hpp"

namespace rhc::internal {

// application/x-www-form-urlencoded, insertion order, encodeURIComponent escaping.
std::string form_urlencode(const FormData& form);

// Case-insensitive header lookup (utility)
std::string hdr_ci(const Headers& H, const char* name);
bool has_hdr_ci(const Headers& H, const char* name);

// Rejects empty names, non-token name characters and CR/LF/NUL in values.
bool valid_header_name(const std::string& name);
bool valid_header_value(const std::string& value);

// Request line + headers + blank line. Adds Host, User-Agent, Connection
// and Content-Length when the caller did not.
std::string build_request_head(const ConnectionConfig& conn,
                               const OutboundRequest& req,
                               const std::string& user_agent);

// Parse "HTTP/1.1 200 OK\r\n...\r\n\r\n". Header names are lower-cased and
// repeated headers joined with ", ". hdr_end_off points past the blank line.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         Headers& headers);

// Hex chunk-size line of a chunked body, extensions ignored.
bool parse_chunk_size(const std::string& line, std::size_t& out);

} // namespace rhc::internal
