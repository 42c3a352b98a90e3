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
#include "rhc/log.hpp"
#include "rhc/transport.hpp"

namespace rhc::internal {

// Returns a copy of conn whose agent carries a fingerprint-pinning verifier.
// An empty fingerprint returns conn unchanged. Existing agent settings are kept;
// only the server-identity check is replaced. The logger must outlive the
// returned configuration.
ConnectionConfig bind_identity(ConnectionConfig conn, const std::string& fingerprint, Logger& log);

// Peer digest chosen for comparison: SHA-256 if present, else SHA-1.
const std::string& peer_fingerprint(const PeerCertificate& cert);

bool fingerprints_match(const std::string& expected, const std::string& actual);

} // namespace rhc::internal
