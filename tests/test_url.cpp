/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */


#include <gtest/gtest.h>

#include "rhc/internal/url.hpp"

using rhc::internal::parse_url;

TEST(ParseUrl, SchemeHostPortPath) {
    auto u = parse_url("https://API.Example.com:8443/v1/items?x=1#frag");

    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->protocol, "https:");
    EXPECT_EQ(u->hostname, "api.example.com");
    ASSERT_TRUE(u->port.has_value());
    EXPECT_EQ(*u->port, 8443);
    EXPECT_EQ(u->path, "/v1/items?x=1");
}

TEST(ParseUrl, DefaultPortIsDropped) {
    auto a = parse_url("http://example.com:80");
    auto b = parse_url("https://example.com:443/");

    ASSERT_TRUE(a && b);
    EXPECT_FALSE(a->port.has_value());
    EXPECT_FALSE(b->port.has_value());
    EXPECT_EQ(a->path, "/");
}

TEST(ParseUrl, QueryOnlyGetsRootPath) {
    auto u = parse_url("http://example.com?q=1");

    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->path, "/?q=1");
}

TEST(ParseUrl, Ipv6AndCredentials) {
    auto v6 = parse_url("http://[::1]:8080/x");
    auto cred = parse_url("http://user:pw@host.local/");

    ASSERT_TRUE(v6 && cred);
    EXPECT_EQ(v6->hostname, "::1");
    EXPECT_EQ(*v6->port, 8080);
    EXPECT_EQ(cred->hostname, "host.local");
}

TEST(ParseUrl, NotAbsolute) {
    EXPECT_FALSE(parse_url("invalid-host").has_value());
    EXPECT_FALSE(parse_url("/just/a/path").has_value());
    EXPECT_FALSE(parse_url("").has_value());
    EXPECT_FALSE(parse_url("http://").has_value());
    EXPECT_FALSE(parse_url("http://example.com:99999").has_value());
    EXPECT_FALSE(parse_url("http://example.com:8a").has_value());
    EXPECT_FALSE(parse_url("http://bad host/").has_value());
}

TEST(ParseUrl, OtherSchemesKeepProtocol) {
    auto ftp = parse_url("FTP://files.example.com/pub");
    auto opaque = parse_url("localhost:8080");

    ASSERT_TRUE(ftp && opaque);
    EXPECT_EQ(ftp->protocol, "ftp:");
    EXPECT_EQ(opaque->protocol, "localhost:");
}
