/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/tls_identity.hpp"
#include "rhc/internal/utils.hpp"
#include <optional>
#include <utility>

namespace rhc::internal {

const std::string& peer_fingerprint(const PeerCertificate& cert) {
    return cert.fingerprint256.empty() ? cert.fingerprint : cert.fingerprint256;
}

bool fingerprints_match(const std::string& expected, const std::string& actual) {
    const std::string a = normalize_fingerprint(expected);
    const std::string b = normalize_fingerprint(actual);
    if (a.empty() || b.empty()) return false;
    return ct_equal(a, b);
}

ConnectionConfig bind_identity(ConnectionConfig conn, const std::string& fingerprint, Logger& log) {
    if (fingerprint.empty()) return conn;

    Logger* lg = &log;
    IdentityVerifier verify = [fingerprint, lg](const std::string& host,
                                                const PeerCertificate& cert) -> std::optional<std::string> {
        const std::string& cert_fp = peer_fingerprint(cert);

        safe_log(*lg, LogLevel::Info, "Checking fingerprint for host: " + host + ", fingerprint is " + cert_fp);
        if (fingerprints_match(fingerprint, cert_fp)) {
            safe_log(*lg, LogLevel::Info, "Fingerprint validated successfully");
            return std::nullopt;
        }

        std::string reason = "Fingerprint for host " + host + " does not match";
        safe_log(*lg, LogLevel::Info, "Failed to validate fingerprint", {{"reason", reason}});
        return reason;
    };

    if (!conn.agent) conn.agent.emplace();
    conn.agent->check_server_identity = std::move(verify);
    return conn;
}

} // namespace rhc::internal
