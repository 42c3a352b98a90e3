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
#include <memory>
#include <optional>
#include "rhc/errors.hpp"
#include "rhc/http_response.hpp"

namespace rhc {

// Two-slot outcome: exactly one of (error, nullopt) or (nullptr, value).
// Supports `auto [err, resp] = client.get(...)`.
struct Result {
    std::shared_ptr<Error> error;
    std::optional<Response> value;

    bool ok() const { return error == nullptr; }

    static Result success(Response r) { return Result{nullptr, std::move(r)}; }
    static Result failure(std::shared_ptr<Error> e) { return Result{std::move(e), std::nullopt}; }
};

// Call boundary: runs fn and materializes a raised error into the error slot.
// Anything that is not an rhc::Error is reported as TransportError.
template <typename Fn>
Result to_result(Fn&& fn) {
    try {
        return Result::success(fn());
    } catch (const Error& e) {
        return Result::failure(e.clone());
    } catch (const std::exception& e) {
        return Result::failure(std::make_shared<TransportError>(e.what()));
    } catch (...) {
        return Result::failure(std::make_shared<TransportError>("unknown error"));
    }
}

} // namespace rhc
