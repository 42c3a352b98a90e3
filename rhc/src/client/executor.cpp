/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/executor.hpp"
#include "rhc/errors.hpp"
#include "rhc/internal/http_parser.hpp"

#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace rhc::internal {
namespace {

using Tag = AttemptOutcome::Tag;

AttemptOutcome succeeded(Response resp) {
    AttemptOutcome out;
    out.tag = Tag::Success;
    out.response = std::move(resp);
    return out;
}

template <typename E>
AttemptOutcome failed(E err, bool retryable, std::string reason) {
    AttemptOutcome out;
    out.tag = retryable ? Tag::RetryableFailure : Tag::TerminalFailure;
    out.error = std::make_exception_ptr(std::move(err));
    out.reason = std::move(reason);
    return out;
}

} // namespace

RequestExecutor::RequestExecutor(Transport& transport, Logger& logger, const ContentDecoder& decoder)
    : _transport(transport), _log(logger), _decoder(decoder) {}

OutboundRequest RequestExecutor::prepare(Method method, const RequestOptions& opts, const std::optional<RequestBody>& body) {
    OutboundRequest req;
    req.method = method;
    req.path = opts.path.empty() ? "/" : opts.path;
    req.headers = opts.headers;
    req.timeout = opts.timeout;

    if (body) {
        if (const auto* raw = std::get_if<std::string>(&*body)) {
            req.body = *raw;
        } else {
            req.body = form_urlencode(std::get<FormData>(*body));
            if (!req.body.empty() && !has_hdr_ci(req.headers, "Content-Type")) {
                req.headers["Content-Type"] = "application/x-www-form-urlencoded";
            }
        }
    }
    return req;
}

Response RequestExecutor::run(const ConnectionConfig& conn,
                              Method method,
                              const RequestOptions& opts,
                              const std::optional<RequestBody>& body,
                              const std::string& url) const
{
    const OutboundRequest req = prepare(method, opts, body);

    for (unsigned retries = 0;; ++retries) {
        const bool budget_left = retries < opts.max_retries;
        AttemptOutcome out = attempt(conn, req, url, retries + 1, budget_left);

        if (out.tag == Tag::Success) {
            return std::move(*out.response);
        }
        if (out.tag == Tag::TerminalFailure) {
            std::rethrow_exception(out.error);
        }

        safe_log(_log, LogLevel::Info, "Retrying request", {
            {"attempt", std::to_string(retries + 2)},
            {"maxRetries", std::to_string(opts.max_retries)},
            {"reason", out.reason},
        });

        // Zero delay still yields so the next attempt starts on a fresh turn.
        if (opts.retry_delay.count() > 0) {
            std::this_thread::sleep_for(opts.retry_delay);
        } else {
            std::this_thread::yield();
        }
    }
}

AttemptOutcome RequestExecutor::attempt(const ConnectionConfig& conn, const OutboundRequest& req,
                                        const std::string& url, unsigned attempt_no, bool budget_left) const
{
    // Connecting: a synchronous failure here is local and never retried.
    std::unique_ptr<Exchange> ex;
    try {
        ex = _transport.open(conn, req);
    } catch (const Error& e) {
        safe_log(_log, LogLevel::Error, e.what());
        AttemptOutcome out;
        out.tag = Tag::TerminalFailure;
        out.error = std::current_exception();
        out.reason = e.what();
        return out;
    } catch (const std::invalid_argument& e) {
        safe_log(_log, LogLevel::Error, e.what());
        return failed(ValidationError(e.what()), false, e.what());
    } catch (const std::domain_error& e) {
        safe_log(_log, LogLevel::Error, e.what());
        return failed(ValidationError(e.what()), false, e.what());
    } catch (const std::exception& e) {
        safe_log(_log, LogLevel::Error, "Request failed", {{"err", e.what()}});
        return failed(TransportError(e.what()), false, e.what());
    } catch (...) {
        safe_log(_log, LogLevel::Error, "Request failed", {{"err", "unknown error"}});
        return failed(TransportError("unknown error"), false, "unknown error");
    }
    if (!ex) {
        return failed(TransportError("transport produced no exchange"), false, "no exchange");
    }

    // Streaming: buffer everything, decode only once the body ends.
    Response resp;
    resp.method = req.method;
    resp.url = url;
    resp.attempts = attempt_no;
    bool have_head = false;
    std::string raw;

    for (;;) {
        TransportEvent ev;
        try {
            ev = ex->next();
        } catch (const std::exception& e) {
            // Mid-stream failure of the exchange, retried like an Error event.
            safe_log(_log, LogLevel::Error, "Request failed", {{"err", e.what()}});
            return failed(TransportError(e.what()), budget_left, e.what());
        } catch (...) {
            safe_log(_log, LogLevel::Error, "Request failed", {{"err", "unknown error"}});
            return failed(TransportError("unknown error"), budget_left, "unknown error");
        }
        switch (ev.type) {
            case TransportEvent::Type::Response:
                resp.status_code = ev.status_code;
                resp.status_message = std::move(ev.status_message);
                resp.headers = std::move(ev.headers);
                have_head = true;
                break;

            case TransportEvent::Type::Data:
                raw += ev.chunk;
                break;

            case TransportEvent::Type::End:
                if (!have_head) {
                    return failed(TransportError("response ended before headers"), budget_left, "no response head");
                }
                return decide(std::move(resp), raw, budget_left);

            case TransportEvent::Type::Error:
                safe_log(_log, LogLevel::Error, "Request failed", {{"err", ev.detail}});
                return failed(TransportError(ev.detail), budget_left, ev.detail);

            case TransportEvent::Type::Timeout:
                safe_log(_log, LogLevel::Error, RequestTimeoutError::kMessage);
                return failed(RequestTimeoutError(), budget_left, "timeout");

            case TransportEvent::Type::Abort:
                safe_log(_log, LogLevel::Error, ServiceUnavailableError::kMessage);
                return failed(ServiceUnavailableError(), budget_left, "abort");
        }
    }
}

AttemptOutcome RequestExecutor::decide(Response resp, const std::string& raw, bool budget_left) const {
    const bool ok = is_success_status(resp.status_code);
    const std::string reason = "status " + std::to_string(resp.status_code);

    if (raw.empty()) {
        safe_log(_log, LogLevel::Info, "No data in response", {{"statusCode", std::to_string(resp.status_code)}});
        if (!ok) return failed(StatusError(std::move(resp)), budget_left, reason);
        return succeeded(std::move(resp));
    }

    try {
        resp.data = _decoder.decode(raw, hdr_ci(resp.headers, "content-type"));
    } catch (const DecodeError& e) {
        // The same malformed body would come back on retry.
        safe_log(_log, LogLevel::Error, "Failed to parse data: " + raw);
        return failed(DecodeError(e.what(), raw, resp.status_code), false, "decode");
    }

    if (!ok) return failed(StatusError(std::move(resp)), budget_left, reason);
    return succeeded(std::move(resp));
}

} // namespace rhc::internal
