/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/types.hpp"
#include "rhc/transport.hpp"
#include <utility>

namespace rhc {

const char* method_name(Method m) {
    switch (m) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

const char* scheme_name(Scheme s) {
    return s == Scheme::Https ? "https:" : "http:";
}

std::uint16_t default_port(Scheme s) {
    return s == Scheme::Https ? 443 : 80;
}

TransportEvent TransportEvent::response(int code, std::string message, Headers headers) {
    TransportEvent ev;
    ev.type = Type::Response;
    ev.status_code = code;
    ev.status_message = std::move(message);
    ev.headers = std::move(headers);
    return ev;
}

TransportEvent TransportEvent::data(std::string chunk) {
    TransportEvent ev;
    ev.type = Type::Data;
    ev.chunk = std::move(chunk);
    return ev;
}

TransportEvent TransportEvent::end() {
    TransportEvent ev;
    ev.type = Type::End;
    return ev;
}

TransportEvent TransportEvent::error(std::string detail) {
    TransportEvent ev;
    ev.type = Type::Error;
    ev.detail = std::move(detail);
    return ev;
}

TransportEvent TransportEvent::timeout() {
    TransportEvent ev;
    ev.type = Type::Timeout;
    return ev;
}

TransportEvent TransportEvent::abort() {
    TransportEvent ev;
    ev.type = Type::Abort;
    return ev;
}

} // namespace rhc
