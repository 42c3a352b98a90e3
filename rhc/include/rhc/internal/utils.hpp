/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace rhc::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string lower_copy(std::string s);
bool starts_with_ci(const std::string& s, const std::string& prefix);

// "AB:CD:EF" form used for certificate fingerprints.
std::string bytes_to_colon_hex(const unsigned char* p, std::size_t n);

// Strips ':' and lower-cases, so "AB:cd" and "abcd" compare equal.
std::string normalize_fingerprint(const std::string& fp);

// Constant-time comparison of two equally formatted digests.
bool ct_equal(const std::string& a, const std::string& b);

// Decodes bytes as UTF-8; invalid or truncated sequences become U+FFFD.
std::string utf8_sanitize(const std::string& bytes);

} // namespace rhc::internal
