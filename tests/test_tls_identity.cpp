/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */


#include <gtest/gtest.h>

#include "rhc/internal/tls_identity.hpp"
#include "test_support.hpp"

using namespace rhc;
using namespace rhc::internal;
using rhc::test::RecordingLogger;

namespace {

PeerCertificate cert_with(const std::string& sha256, const std::string& sha1 = "11:22") {
    PeerCertificate c;
    c.subject = "/CN=api.example.com";
    c.fingerprint256 = sha256;
    c.fingerprint = sha1;
    return c;
}

ConnectionConfig https_conn() {
    ConnectionConfig conn;
    conn.scheme = Scheme::Https;
    conn.host = "api.example.com";
    conn.port = 443;
    return conn;
}

} // namespace

TEST(BindIdentity, EmptyFingerprintLeavesConfigAlone) {
    RecordingLogger log;

    ConnectionConfig out = bind_identity(https_conn(), "", log);

    EXPECT_FALSE(out.agent.has_value());
    EXPECT_TRUE(log.entries().empty());
}

TEST(BindIdentity, AcceptsMatchingDigest) {
    RecordingLogger log;
    ConnectionConfig out = bind_identity(https_conn(), "AA:BB:CC", log);
    ASSERT_TRUE(out.agent && out.agent->check_server_identity);

    auto verdict = out.agent->check_server_identity("api.example.com", cert_with("AA:BB:CC"));

    EXPECT_FALSE(verdict.has_value());
    EXPECT_EQ(log.count("Checking fingerprint for host: api.example.com, fingerprint is AA:BB:CC"), 1u);
    EXPECT_EQ(log.count("Fingerprint validated successfully"), 1u);
}

TEST(BindIdentity, ComparisonIgnoresCaseAndColons) {
    RecordingLogger log;
    ConnectionConfig out = bind_identity(https_conn(), "aabbcc", log);

    EXPECT_FALSE(out.agent->check_server_identity("api.example.com", cert_with("AA:BB:CC")).has_value());
}

TEST(BindIdentity, RejectsOtherDigest) {
    RecordingLogger log;
    ConnectionConfig out = bind_identity(https_conn(), "AA:BB:CC", log);

    auto verdict = out.agent->check_server_identity("api.example.com", cert_with("AA:BB:CD"));

    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(*verdict, "Fingerprint for host api.example.com does not match");
    EXPECT_EQ(log.count("Fingerprint validated successfully"), 0u);
    EXPECT_EQ(log.meta_of("Failed to validate fingerprint", "reason"), *verdict);
}

TEST(BindIdentity, FallsBackToSha1WhenSha256Missing) {
    RecordingLogger log;
    ConnectionConfig out = bind_identity(https_conn(), "11:22", log);

    EXPECT_FALSE(out.agent->check_server_identity("api.example.com", cert_with("", "11:22")).has_value());
    EXPECT_TRUE(out.agent->check_server_identity("api.example.com", cert_with("AA", "11:22")).has_value());
}

TEST(BindIdentity, KeepsExistingAgentSettings) {
    RecordingLogger log;
    ConnectionConfig conn = https_conn();
    conn.agent = TlsAgentOptions{};
    conn.agent->verify_peer = false;
    conn.agent->ca_file = "/etc/pki/ca.pem";

    ConnectionConfig out = bind_identity(conn, "AA", log);

    ASSERT_TRUE(out.agent.has_value());
    EXPECT_EQ(out.agent->verify_peer, false);
    EXPECT_EQ(out.agent->ca_file, "/etc/pki/ca.pem");
    EXPECT_TRUE(static_cast<bool>(out.agent->check_server_identity));
    EXPECT_FALSE(static_cast<bool>(conn.agent->check_server_identity));
}

TEST(FingerprintsMatch, EmptyNeverMatches) {
    EXPECT_FALSE(fingerprints_match("", ""));
    EXPECT_FALSE(fingerprints_match("AA", ""));
    EXPECT_FALSE(fingerprints_match(":", "::"));
    EXPECT_TRUE(fingerprints_match("aa:bb", "AABB"));
}
