/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <exception>
#include <optional>
#include <string>
#include "rhc/http_response.hpp"
#include "rhc/log.hpp"
#include "rhc/request_options.hpp"
#include "rhc/transport.hpp"
#include "rhc/internal/content_decoder.hpp"

namespace rhc::internal {

// Result of one transport round, consumed by the retry decision.
struct AttemptOutcome {
    enum class Tag { Success, RetryableFailure, TerminalFailure };

    Tag tag = Tag::TerminalFailure;
    std::optional<Response> response;   // Success
    std::exception_ptr error;           // failures; holds an rhc::Error
    std::string reason;                 // short text for the retry log
};

// Drives one logical call: attempt, classify, retry with a constant delay,
// decode. Stateless between calls; safe to share across threads.
class RequestExecutor {
public:
    RequestExecutor(Transport& transport, Logger& logger, const ContentDecoder& decoder);

    // Returns the successful response or throws the terminal rhc::Error.
    Response run(const ConnectionConfig& conn,
                 Method method,
                 const RequestOptions& opts,
                 const std::optional<RequestBody>& body,
                 const std::string& url) const;

    // Serialized request shared by every attempt of one call.
    static OutboundRequest prepare(Method method, const RequestOptions& opts, const std::optional<RequestBody>& body);

private:
    AttemptOutcome attempt(const ConnectionConfig& conn, const OutboundRequest& req,
                           const std::string& url, unsigned attempt_no, bool budget_left) const;

    AttemptOutcome decide(Response resp, const std::string& raw, bool budget_left) const;

    Transport& _transport;
    Logger& _log;
    const ContentDecoder& _decoder;
};

} // namespace rhc::internal
