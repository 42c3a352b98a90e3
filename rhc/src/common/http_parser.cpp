/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/http_parser.hpp"
#include "rhc/internal/utils.hpp"
#include <sstream>
#include <cctype>
#include <strings.h> // strcasecmp

namespace rhc::internal {

std::string form_urlencode(const FormData& form){
    auto enc = [](const std::string& s){
        auto is_unreserved = [](unsigned char c){
            if (std::isalnum(c)) return true;
            switch (c) {
                case '-': case '_': case '.': case '!': case '~':
                case '*': case '\'': case '(': case ')':
                    return true;
                default:
                    return false;
            }
        };
        std::string out; out.reserve(s.size()*3);
        for(unsigned char c: s){
            if(c < 0x80 && is_unreserved(c)) out.push_back((char)c);
            else {
                static const char* H="0123456789ABCDEF";
                out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
            }
        }
        return out;
    };

    std::string out;
    for(const auto& kv: form){
        if(!out.empty()) out.push_back('&');
        out += enc(kv.first);
        out.push_back('=');
        out += enc(kv.second);
    }
    return out;
}

std::string hdr_ci(const Headers& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool has_hdr_ci(const Headers& H, const char* name){
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return true;
    }
    return false;
}

bool valid_header_name(const std::string& name){
    if (name.empty()) return false;
    static const char* extra = "!#$%&'*+-.^_`|~";
    for (unsigned char c : name) {
        if (std::isalnum(c)) continue;
        bool ok = false;
        for (const char* p = extra; *p; ++p) if ((unsigned char)*p == c) { ok = true; break; }
        if (!ok) return false;
    }
    return true;
}

bool valid_header_value(const std::string& value){
    for (unsigned char c : value) {
        if (c == '\r' || c == '\n' || c == '\0') return false;
    }
    return true;
}

std::string build_request_head(const ConnectionConfig& conn,
                               const OutboundRequest& req,
                               const std::string& user_agent)
{
    std::ostringstream oss;
    oss << method_name(req.method) << ' ' << (req.path.empty() ? "/" : req.path) << " HTTP/1.1\r\n";

    if (!has_hdr_ci(req.headers, "Host")) {
        const bool v6 = conn.host.find(':') != std::string::npos;
        oss << "Host: " << (v6 ? "[" + conn.host + "]" : conn.host);
        if (conn.port != default_port(conn.scheme)) oss << ':' << conn.port;
        oss << "\r\n";
    }
    if (!has_hdr_ci(req.headers, "User-Agent") && !user_agent.empty()) {
        oss << "User-Agent: " << user_agent << "\r\n";
    }
    for (const auto& kv : req.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    if (!has_hdr_ci(req.headers, "Connection")) {
        oss << "Connection: close\r\n";
    }
    const bool carries_body = !req.body.empty() || req.method == Method::Post || req.method == Method::Put;
    if (carries_body && !has_hdr_ci(req.headers, "Content-Length") &&
        !has_hdr_ci(req.headers, "Transfer-Encoding")) {
        oss << "Content-Length: " << req.body.size() << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         Headers& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (status_code < 100 || status_code > 999) return false;
    std::getline(iss, status_text);
    trim_inplace(status_text);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = lower_copy(line.substr(0, c)), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        auto it = headers.find(k);
        if (it == headers.end()) headers.emplace(std::move(k), std::move(v));
        else it->second += ", " + v;
    }
    return true;
}

bool parse_chunk_size(const std::string& line, std::size_t& out){
    std::size_t end = line.find(';');
    std::string hex = line.substr(0, end);
    trim_inplace(hex);
    if (hex.empty() || hex.size() > 15) return false;
    std::size_t v = 0;
    for (char c : hex) {
        int h = hexval(c);
        if (h < 0) return false;
        v = (v << 4) | (std::size_t)h;
    }
    out = v;
    return true;
}

} // namespace rhc::internal
