/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/internal/http_low.hpp"
#include "rhc/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll
#include <cerrno>
#include <cstring>

namespace rhc::internal {

std::string errno_name(int e) {
    switch (e) {
        case ECONNREFUSED: return "ECONNREFUSED";
        case ECONNRESET:   return "ECONNRESET";
        case ETIMEDOUT:    return "ETIMEDOUT";
        case EHOSTUNREACH: return "EHOSTUNREACH";
        case ENETUNREACH:  return "ENETUNREACH";
        case EPIPE:        return "EPIPE";
        case EADDRNOTAVAIL:return "EADDRNOTAVAIL";
        default:           return "errno " + std::to_string(e);
    }
}

TcpConn::~TcpConn() { close(); }

IoStatus TcpConn::open(const std::string& host, std::uint16_t port, int connect_timeout_ms, std::string& err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = std::string("getaddrinfo ENOTFOUND ") + host + " (" + gai_strerror(rc) + ")";
        rhc::log_line("[TCP] " + err);
        return IoStatus::Failed;
    }

    const std::string target = host + ":" + std::to_string(port);
    bool timed_out = false;
    int last_errno = 0;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms > 0 ? connect_timeout_ms : -1);
            } while (pr < 0 && errno == EINTR);

            if (pr == 0) {
                timed_out = true;
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (pr < 0 || getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr != 0 ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        if (timed_out && last_errno == 0) {
            rhc::log_line("[TCP] connect timed out: " + target);
            return IoStatus::Timeout;
        }
        err = "connect " + errno_name(last_errno) + " " + target;
        rhc::log_line("[TCP] " + err);
        return IoStatus::Failed;
    }

    _fd = s_ok;
    return IoStatus::Ok;
}

void TcpConn::set_io_timeout(int timeout_ms) {
    if (_fd < 0) return;
    timeval tv{};
    if (timeout_ms > 0) {
        tv.tv_sec  = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
    }
    setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

IoStatus TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return IoStatus::Timeout;
        if (n <= 0) return IoStatus::Failed;
        off += (std::size_t)n;
    }
    return IoStatus::Ok;
}

IoStatus TcpConn::recv_some(char* d, std::size_t cap, std::size_t& got) {
    got = 0;
    for (;;) {
        ssize_t n = ::recv(_fd, d, cap, 0);
        if (n > 0) { got = (std::size_t)n; return IoStatus::Ok; }
        if (n == 0) return IoStatus::Closed;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::Timeout;
        return IoStatus::Failed;
    }
}

} // namespace rhc::internal
