/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "rhc/http_response.hpp"

namespace rhc {

enum class ErrorKind {
    Validation,  // bad input, never retried
    Transport,   // connection level, retried up to budget
    Timeout,     // retried up to budget
    Abort,       // retried up to budget
    Decode,      // never retried
    Status       // non-2xx, retried up to budget
};

const char* error_kind_name(ErrorKind k);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg, std::optional<int> status_code = std::nullopt);

    ErrorKind kind() const noexcept { return _kind; }
    const std::optional<int>& status_code() const noexcept { return _status; }

    // Polymorphic copy, used to hand a caught error to the result slot.
    virtual std::shared_ptr<Error> clone() const;

private:
    ErrorKind _kind;
    std::optional<int> _status;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg);
    std::shared_ptr<Error> clone() const override;
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& msg);
    std::shared_ptr<Error> clone() const override;
};

class RequestTimeoutError : public Error {
public:
    static constexpr const char* kMessage = "Failed due timeout reason";
    RequestTimeoutError();
    std::shared_ptr<Error> clone() const override;
};

class ServiceUnavailableError : public Error {
public:
    static constexpr const char* kMessage = "Failed due abort reason";
    ServiceUnavailableError();
    std::shared_ptr<Error> clone() const override;
};

class DecodeError : public Error {
public:
    DecodeError(const std::string& msg, std::string raw_body);
    DecodeError(const std::string& msg, std::string raw_body, int status_code);

    const std::string& raw_body() const noexcept { return _raw; }
    std::shared_ptr<Error> clone() const override;

private:
    std::string _raw;
};

// Non-success status after the retry budget is spent. Carries the whole response.
class StatusError : public Error {
public:
    explicit StatusError(Response resp);

    const Response& response() const noexcept { return _resp; }
    std::shared_ptr<Error> clone() const override;

private:
    Response _resp;
};

} // namespace rhc
