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

enum class IoStatus {
    Ok,
    Timeout,   // SO_*TIMEO or connect deadline expired
    Closed,    // orderly shutdown by peer
    Failed     // socket error, see errno / err text
};

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Resolve host and connect. connect_timeout_ms <= 0 waits for the OS.
    // On failure err holds "connect ECONNREFUSED host:port" style text.
    IoStatus open(const std::string& host, std::uint16_t port, int connect_timeout_ms, std::string& err);

    // Per-operation inactivity bound for send/recv; 0 disables.
    void set_io_timeout(int timeout_ms);

    void close();
    int  fd() const { return _fd; }

    IoStatus send_all(const char* d, std::size_t len);
    IoStatus recv_some(char* d, std::size_t cap, std::size_t& got);

private:
    int _fd = -1;
};

// "ECONNREFUSED" etc., falls back to the numeric value.
std::string errno_name(int e);

} // namespace rhc::internal
