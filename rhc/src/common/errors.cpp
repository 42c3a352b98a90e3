/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/errors.hpp"
#include <utility>

namespace rhc {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Abort:      return "abort";
        case ErrorKind::Decode:     return "decode";
        case ErrorKind::Status:     return "status";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& msg, std::optional<int> status_code)
    : std::runtime_error(msg), _kind(kind), _status(status_code) {}

std::shared_ptr<Error> Error::clone() const { return std::make_shared<Error>(*this); }

ValidationError::ValidationError(const std::string& msg)
    : Error(ErrorKind::Validation, msg) {}

std::shared_ptr<Error> ValidationError::clone() const { return std::make_shared<ValidationError>(*this); }

TransportError::TransportError(const std::string& msg)
    : Error(ErrorKind::Transport, msg) {}

std::shared_ptr<Error> TransportError::clone() const { return std::make_shared<TransportError>(*this); }

RequestTimeoutError::RequestTimeoutError()
    : Error(ErrorKind::Timeout, kMessage) {}

std::shared_ptr<Error> RequestTimeoutError::clone() const { return std::make_shared<RequestTimeoutError>(*this); }

ServiceUnavailableError::ServiceUnavailableError()
    : Error(ErrorKind::Abort, kMessage) {}

std::shared_ptr<Error> ServiceUnavailableError::clone() const { return std::make_shared<ServiceUnavailableError>(*this); }

DecodeError::DecodeError(const std::string& msg, std::string raw_body)
    : Error(ErrorKind::Decode, msg), _raw(std::move(raw_body)) {}

DecodeError::DecodeError(const std::string& msg, std::string raw_body, int status_code)
    : Error(ErrorKind::Decode, msg, status_code), _raw(std::move(raw_body)) {}

std::shared_ptr<Error> DecodeError::clone() const { return std::make_shared<DecodeError>(*this); }

StatusError::StatusError(Response resp)
    : Error(ErrorKind::Status,
            "Request failed with status code " + std::to_string(resp.status_code),
            resp.status_code),
      _resp(std::move(resp)) {}

std::shared_ptr<Error> StatusError::clone() const { return std::make_shared<StatusError>(*this); }

} // namespace rhc
