/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <future>
#include <memory>
#include <optional>
#include <string>
#include "rhc/client_config.hpp"
#include "rhc/log.hpp"
#include "rhc/request_options.hpp"
#include "rhc/result.hpp"
#include "rhc/transport.hpp"

namespace rhc {

// Retry/decode engine shared by both front-ends. Front-ends differ only in
// how RequestOptions name the target. Every operation returns a Result and
// never throws; calls are independent and may run concurrently.
class HttpClientBase {
public:
    virtual ~HttpClientBase();

    HttpClientBase(const HttpClientBase&) = delete;
    HttpClientBase& operator=(const HttpClientBase&) = delete;

    // fingerprint: expected peer certificate digest (SHA-256, or SHA-1 for
    // legacy peers); empty disables pinning. Ignored for plain HTTP.
    Result get(const RequestOptions& opts, const std::string& fingerprint = {}) const;
    Result post(const RequestOptions& opts, const std::string& fingerprint = {},
                const std::optional<RequestBody>& body = std::nullopt) const;
    Result put(const RequestOptions& opts, const std::string& fingerprint = {},
               const std::optional<RequestBody>& body = std::nullopt) const;
    Result del(const RequestOptions& opts, const std::string& fingerprint = {},
               const std::optional<RequestBody>& body = std::nullopt) const;

    Result request(Method method, const RequestOptions& opts, const std::string& fingerprint = {},
                   const std::optional<RequestBody>& body = std::nullopt) const;

    // Same call on a dedicated thread. The client must outlive the future.
    std::future<Result> request_async(Method method, RequestOptions opts, std::string fingerprint = {},
                                      std::optional<RequestBody> body = std::nullopt) const;
    std::future<Result> get_async(RequestOptions opts, std::string fingerprint = {}) const;
    std::future<Result> post_async(RequestOptions opts, std::string fingerprint = {},
                                   std::optional<RequestBody> body = std::nullopt) const;
    std::future<Result> put_async(RequestOptions opts, std::string fingerprint = {},
                                  std::optional<RequestBody> body = std::nullopt) const;
    std::future<Result> del_async(RequestOptions opts, std::string fingerprint = {},
                                  std::optional<RequestBody> body = std::nullopt) const;

    const ClientConfig& config() const;

protected:
    // nullptr logger -> LineLogger; nullptr transport -> SocketTransport.
    HttpClientBase(const ClientConfig& cfg, std::shared_ptr<Logger> logger, std::shared_ptr<Transport> transport);

    // Maps opts onto scheme/host/port. `path` enters as opts.path and may be
    // replaced. Throws ValidationError.
    virtual ConnectionConfig resolve(const RequestOptions& opts, std::string& path) const = 0;

    Logger& logger() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// `host` is a full URL: "https://api.example.com:8443". Only http: and https:
// are accepted. An explicit port in the URL wins over opts.port; an empty
// opts.path takes the URL's path.
class Client final : public HttpClientBase {
public:
    explicit Client(const ClientConfig& cfg = ClientConfig{},
                    std::shared_ptr<Logger> logger = nullptr,
                    std::shared_ptr<Transport> transport = nullptr);

protected:
    ConnectionConfig resolve(const RequestOptions& opts, std::string& path) const override;
};

// Protocol fixed at construction; opts.hostname (or opts.host) is a bare host name.
class LegacyClient final : public HttpClientBase {
public:
    explicit LegacyClient(Scheme scheme,
                          const ClientConfig& cfg = ClientConfig{},
                          std::shared_ptr<Logger> logger = nullptr,
                          std::shared_ptr<Transport> transport = nullptr);

    Scheme scheme() const { return _scheme; }

protected:
    ConnectionConfig resolve(const RequestOptions& opts, std::string& path) const override;

private:
    Scheme _scheme;
};

} // namespace rhc
