/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/client.hpp"
#include "rhc/errors.hpp"
#include "rhc/socket_transport.hpp"

#include "rhc/internal/content_decoder.hpp"
#include "rhc/internal/executor.hpp"
#include "rhc/internal/tls_identity.hpp"
#include "rhc/internal/url.hpp"

#include <utility>

namespace rhc {
namespace {

std::string format_url(const ConnectionConfig& conn, const std::string& path) {
    std::string url = scheme_name(conn.scheme);
    url += "//";
    url += conn.host.find(':') != std::string::npos ? "[" + conn.host + "]" : conn.host;
    if (conn.port != default_port(conn.scheme)) url += ":" + std::to_string(conn.port);
    url += path.empty() ? "/" : path;
    return url;
}

} // namespace

struct HttpClientBase::Impl {
    ClientConfig cfg;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<Transport> transport;
    internal::ContentDecoder decoder;
    internal::RequestExecutor executor;

    Impl(const ClientConfig& c, std::shared_ptr<Logger> lg, std::shared_ptr<Transport> tr)
        : cfg(c),
          logger(std::move(lg)),
          transport(std::move(tr)),
          decoder(c.binary_mime_types, c.binary_mime_prefixes),
          executor(*transport, *logger, decoder) {}
};

namespace {

std::shared_ptr<Logger> default_logger(const ClientConfig& cfg, std::shared_ptr<Logger> lg) {
    if (lg) return lg;
    rhc::set_log_file(cfg.log_file);
    return std::make_shared<LineLogger>("CLIENT");
}

std::shared_ptr<Transport> default_transport(const ClientConfig& cfg, std::shared_ptr<Transport> tr) {
    if (tr) return tr;
    return std::make_shared<SocketTransport>(cfg);
}

} // namespace

HttpClientBase::HttpClientBase(const ClientConfig& cfg, std::shared_ptr<Logger> logger, std::shared_ptr<Transport> transport)
    : _p(std::make_unique<Impl>(cfg, default_logger(cfg, std::move(logger)), default_transport(cfg, std::move(transport)))) {}

HttpClientBase::~HttpClientBase() = default;

const ClientConfig& HttpClientBase::config() const { return _p->cfg; }

Logger& HttpClientBase::logger() const { return *_p->logger; }

Result HttpClientBase::request(Method method, const RequestOptions& opts, const std::string& fingerprint,
                               const std::optional<RequestBody>& body) const
{
    return to_result([&]() -> Response {
        std::string path = opts.path;
        ConnectionConfig conn = resolve(opts, path);
        conn.agent = opts.agent;
        if (conn.scheme == Scheme::Https) {
            conn = internal::bind_identity(std::move(conn), fingerprint, *_p->logger);
        }

        RequestOptions effective = opts;
        effective.path = path.empty() ? "/" : path;
        return _p->executor.run(conn, method, effective, body, format_url(conn, effective.path));
    });
}

Result HttpClientBase::get(const RequestOptions& opts, const std::string& fingerprint) const {
    return request(Method::Get, opts, fingerprint, std::nullopt);
}

Result HttpClientBase::post(const RequestOptions& opts, const std::string& fingerprint,
                            const std::optional<RequestBody>& body) const {
    return request(Method::Post, opts, fingerprint, body);
}

Result HttpClientBase::put(const RequestOptions& opts, const std::string& fingerprint,
                           const std::optional<RequestBody>& body) const {
    return request(Method::Put, opts, fingerprint, body);
}

Result HttpClientBase::del(const RequestOptions& opts, const std::string& fingerprint,
                           const std::optional<RequestBody>& body) const {
    return request(Method::Delete, opts, fingerprint, body);
}

std::future<Result> HttpClientBase::request_async(Method method, RequestOptions opts, std::string fingerprint,
                                                  std::optional<RequestBody> body) const
{
    return std::async(std::launch::async,
                      [this, method, opts = std::move(opts), fp = std::move(fingerprint), b = std::move(body)]() {
                          return request(method, opts, fp, b);
                      });
}

std::future<Result> HttpClientBase::get_async(RequestOptions opts, std::string fingerprint) const {
    return request_async(Method::Get, std::move(opts), std::move(fingerprint), std::nullopt);
}

std::future<Result> HttpClientBase::post_async(RequestOptions opts, std::string fingerprint,
                                               std::optional<RequestBody> body) const {
    return request_async(Method::Post, std::move(opts), std::move(fingerprint), std::move(body));
}

std::future<Result> HttpClientBase::put_async(RequestOptions opts, std::string fingerprint,
                                              std::optional<RequestBody> body) const {
    return request_async(Method::Put, std::move(opts), std::move(fingerprint), std::move(body));
}

std::future<Result> HttpClientBase::del_async(RequestOptions opts, std::string fingerprint,
                                              std::optional<RequestBody> body) const {
    return request_async(Method::Delete, std::move(opts), std::move(fingerprint), std::move(body));
}

// ---- Client (URL host) ----

Client::Client(const ClientConfig& cfg, std::shared_ptr<Logger> logger, std::shared_ptr<Transport> transport)
    : HttpClientBase(cfg, std::move(logger), std::move(transport)) {}

ConnectionConfig Client::resolve(const RequestOptions& opts, std::string& path) const {
    const auto url = internal::parse_url(opts.host);
    if (!url) {
        const std::string msg = "Host \"" + opts.host + "\" must include protocol";
        safe_log(logger(), LogLevel::Error, msg, {{"err", "Invalid URL"}});
        throw ValidationError(msg);
    }

    ConnectionConfig conn;
    if (url->protocol == "https:") {
        conn.scheme = Scheme::Https;
    } else if (url->protocol == "http:") {
        conn.scheme = Scheme::Http;
    } else {
        const std::string msg = "Unknown protocol, " + url->protocol;
        safe_log(logger(), LogLevel::Error, msg);
        throw ValidationError(msg);
    }

    conn.host = url->hostname;
    conn.port = url->port ? *url->port : opts.port.value_or(default_port(conn.scheme));
    if (path.empty()) path = url->path;
    return conn;
}

// ---- LegacyClient (protocol-bound) ----

LegacyClient::LegacyClient(Scheme scheme, const ClientConfig& cfg, std::shared_ptr<Logger> logger,
                           std::shared_ptr<Transport> transport)
    : HttpClientBase(cfg, std::move(logger), std::move(transport)), _scheme(scheme) {}

ConnectionConfig LegacyClient::resolve(const RequestOptions& opts, std::string& path) const {
    ConnectionConfig conn;
    conn.scheme = _scheme;
    conn.host = opts.hostname.empty() ? opts.host : opts.hostname;
    if (conn.host.empty()) {
        throw ValidationError("Host must not be empty");
    }
    if (conn.host.size() > 2 && conn.host.front() == '[' && conn.host.back() == ']') {
        conn.host = conn.host.substr(1, conn.host.size() - 2);
    }
    conn.port = opts.port.value_or(default_port(_scheme));
    if (path.empty()) path = "/";
    return conn;
}

} // namespace rhc
