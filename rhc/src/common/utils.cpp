/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/utils.hpp"
#include <algorithm>
#include <cctype>

namespace rhc::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return std::tolower((unsigned char)a) == std::tolower((unsigned char)b);
    });
}

std::string bytes_to_colon_hex(const unsigned char* p, std::size_t n) {
    static const char* H = "0123456789ABCDEF";
    std::string s;
    if (n == 0) return s;
    s.reserve(n * 3 - 1);
    for (std::size_t i = 0; i < n; ++i) {
        if (i) s.push_back(':');
        s.push_back(H[p[i] >> 4]);
        s.push_back(H[p[i] & 0xF]);
    }
    return s;
}

std::string normalize_fingerprint(const std::string& fp) {
    std::string out;
    out.reserve(fp.size());
    for (char c : fp) {
        if (c == ':' || std::isspace((unsigned char)c)) continue;
        out.push_back((char)std::tolower((unsigned char)c));
    }
    return out;
}

bool ct_equal(const std::string& a, const std::string& b){
    if(a.size()!=b.size()) return false;
    unsigned char acc=0;
    for(std::size_t i=0;i<a.size();++i) acc |= (unsigned char)(a[i]^b[i]);
    return acc==0;
}

std::string utf8_sanitize(const std::string& bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = p[i];
        if (c < 0x80) { out.push_back((char)c); ++i; continue; }

        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // bounds for the second byte
        if (c >= 0xC2 && c <= 0xDF) { len = 2; }
        else if (c == 0xE0)               { len = 3; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC)  { len = 3; }
        else if (c == 0xED)               { len = 3; hi = 0x9F; }
        else if (c >= 0xEE && c <= 0xEF)  { len = 3; }
        else if (c == 0xF0)               { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3)  { len = 4; }
        else if (c == 0xF4)               { len = 4; hi = 0x8F; }
        else { out += kReplacement; ++i; continue; }

        // Maximal valid prefix is replaced by a single U+FFFD.
        std::size_t k = 1;
        while (k < len && i + k < n) {
            const unsigned char b = p[i + k];
            const unsigned char blo = (k == 1) ? lo : 0x80;
            const unsigned char bhi = (k == 1) ? hi : 0xBF;
            if (b < blo || b > bhi) break;
            ++k;
        }
        if (k == len) {
            out.append(bytes, i, len);
        } else {
            out += kReplacement;
        }
        i += k;
    }
    return out;
}

} // namespace rhc::internal
