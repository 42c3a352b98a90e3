/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/url.hpp"
#include "rhc/internal/utils.hpp"
#include <cctype>

namespace rhc::internal {

std::optional<ParsedUrl> parse_url(const std::string& input) {
    std::string s = input;
    trim_inplace(s);
    if (s.empty() || !std::isalpha((unsigned char)s[0])) return std::nullopt;

    std::size_t colon = 1;
    while (colon < s.size()) {
        const unsigned char c = (unsigned char)s[colon];
        if (c == ':') break;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::nullopt;
        ++colon;
    }
    if (colon >= s.size()) return std::nullopt;

    ParsedUrl u;
    u.protocol = lower_copy(s.substr(0, colon)) + ":";
    const bool web = (u.protocol == "http:" || u.protocol == "https:");

    std::size_t pos = colon + 1;
    if (web) {
        while (pos < s.size() && (s[pos] == '/' || s[pos] == '\\')) ++pos;
    } else if (s.compare(pos, 2, "//") == 0) {
        pos += 2;
    } else {
        // Opaque URL such as "mailto:x" or "localhost:8080".
        u.path = s.substr(pos);
        return u;
    }

    std::size_t auth_end = s.find_first_of("/?#\\", pos);
    if (auth_end == std::string::npos) auth_end = s.size();
    std::string authority = s.substr(pos, auth_end - pos);

    const std::size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string host, port;
    if (!authority.empty() && authority[0] == '[') {
        const std::size_t rb = authority.find(']');
        if (rb == std::string::npos) return std::nullopt;
        host = authority.substr(1, rb - 1);
        if (rb + 1 < authority.size()) {
            if (authority[rb + 1] != ':') return std::nullopt;
            port = authority.substr(rb + 2);
        }
    } else {
        const std::size_t pc = authority.rfind(':');
        host = authority.substr(0, pc);
        if (pc != std::string::npos) port = authority.substr(pc + 1);
    }

    if (web && host.empty()) return std::nullopt;
    for (unsigned char c : host) {
        if (std::isspace(c) || std::iscntrl(c) || c == '%' || c == '<' || c == '>' || c == '^' || c == '|') {
            return std::nullopt;
        }
    }
    u.hostname = lower_copy(host);

    if (!port.empty()) {
        if (port.size() > 5) return std::nullopt;
        unsigned long v = 0;
        for (char c : port) {
            if (!std::isdigit((unsigned char)c)) return std::nullopt;
            v = v * 10 + (unsigned long)(c - '0');
        }
        if (v > 65535) return std::nullopt;
        const bool is_default = (u.protocol == "http:" && v == 80) || (u.protocol == "https:" && v == 443);
        if (!is_default) u.port = static_cast<std::uint16_t>(v);
    }

    std::string rest = s.substr(auth_end);
    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);
    for (char& c : rest) if (c == '\\') c = '/';
    if (rest.empty() || rest[0] == '?') rest.insert(0, "/");
    u.path = rest;
    return u;
}

} // namespace rhc::internal
