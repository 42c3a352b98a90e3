/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/socket_transport.hpp"
#include "rhc/errors.hpp"
#include "rhc/log.hpp"

#include "rhc/internal/http_low.hpp"
#include "rhc/internal/http_parser.hpp"
#include "rhc/internal/tls_cli_ctx.hpp"
#include "rhc/internal/utils.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cerrno>
#include <limits>

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>

namespace rhc {
namespace {

using internal::IoStatus;

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

// TLS handshake on a non-blocking socket that handles WANT_READ/WANT_WRITE
// within a bounded deadline. timeout_ms <= 0 waits without a deadline.
[[nodiscard]] IoStatus ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_ms) {
    const bool bounded = timeout_ms > 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return IoStatus::Ok;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);
        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) {
            ev = POLLIN;
        } else if (ssl_err == SSL_ERROR_WANT_WRITE) {
            ev = POLLOUT;
        } else if (ssl_err == SSL_ERROR_SYSCALL && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            ev = POLLIN;
        } else {
            if (ssl_err == SSL_ERROR_SYSCALL && errno != 0) {
                rhc::log_line("[TLS-CLI] SSL_connect syscall error: " + internal::errno_name(errno));
            } else {
                rhc::log_line("[TLS-CLI] SSL_connect failed: ssl_error=" + std::to_string(ssl_err));
            }
            internal::log_openssl_errors("SSL_connect");
            return IoStatus::Failed;
        }

        const int ms = bounded ? remaining_ms(deadline) : -1;
        if (bounded && ms <= 0) {
            rhc::log_line("[TLS-CLI] SSL_connect timeout");
            return IoStatus::Timeout;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = ev;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, ms);
        } while (pr < 0 && errno == EINTR);

        if (pr == 0) {
            rhc::log_line("[TLS-CLI] SSL_connect timeout");
            return IoStatus::Timeout;
        }
        if (pr < 0) {
            return IoStatus::Failed;
        }
    }
}

bool is_ip_literal(const std::string& host) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, host.c_str(), tmp) == 1 || ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
}

class SocketExchange : public Exchange {
public:
    SocketExchange(ConnectionConfig conn, std::string wire, int io_timeout_ms, int connect_timeout_ms,
                   std::string sni, std::shared_ptr<internal::TlsClientContext> tls, std::size_t max_header)
        : _conn(std::move(conn)), _wire(std::move(wire)), _io_timeout_ms(io_timeout_ms),
          _connect_timeout_ms(connect_timeout_ms), _sni(std::move(sni)), _tls(std::move(tls)),
          _max_header(max_header) {}

    ~SocketExchange() override { close(); }

    TransportEvent next() override {
        switch (_stage) {
            case Stage::Connect: return start();
            case Stage::Body:    return next_body();
            case Stage::Done:    break;
        }
        return TransportEvent::error("exchange already finished");
    }

private:
    enum class Stage { Connect, Body, Done };
    enum class Framing { None, Length, Chunked, UntilClose };

    TransportEvent start();
    TransportEvent start_tls();
    TransportEvent read_head();
    TransportEvent next_body();
    TransportEvent next_chunked();

    IoStatus write_all(const std::string& data);
    IoStatus read_more();
    IoStatus ensure(std::size_t n);

    TransportEvent take(std::size_t n) {
        std::string chunk = _buf.substr(0, n);
        _buf.erase(0, n);
        return TransportEvent::data(std::move(chunk));
    }

    TransportEvent body_failure(IoStatus st) {
        if (st == IoStatus::Timeout) return fail(TransportEvent::timeout());
        if (st == IoStatus::Closed) return fail(TransportEvent::error("Premature close"));
        return fail(TransportEvent::error("read " + internal::errno_name(errno)));
    }

    TransportEvent fail(TransportEvent ev) {
        close();
        _stage = Stage::Done;
        return ev;
    }

    TransportEvent finish() {
        close();
        _stage = Stage::Done;
        return TransportEvent::end();
    }

    void close() {
        if (_ssl) {
            SSL_shutdown(_ssl.get());
            _ssl.reset(nullptr);
        }
        _tcp.close();
    }

    ConnectionConfig _conn;
    std::string _wire;
    int _io_timeout_ms = 0;
    int _connect_timeout_ms = 0;
    std::string _sni;
    std::shared_ptr<internal::TlsClientContext> _tls;
    std::size_t _max_header = 0;

    internal::TcpConn _tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> _ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};

    Stage _stage = Stage::Connect;
    Framing _framing = Framing::None;
    std::string _buf;
    std::size_t _remaining = 0;     // Length: body bytes left; Chunked: bytes left in chunk
    bool _chunk_crlf = false;       // Chunked: CRLF after chunk data pending
};

TransportEvent SocketExchange::start() {
    std::string err;
    const int connect_ms = _io_timeout_ms > 0 ? _io_timeout_ms : _connect_timeout_ms;
    IoStatus st = _tcp.open(_conn.host, _conn.port, connect_ms, err);
    if (st == IoStatus::Timeout) return fail(TransportEvent::timeout());
    if (st != IoStatus::Ok) return fail(TransportEvent::error(err));

    _tcp.set_io_timeout(_io_timeout_ms);

    if (_conn.scheme == Scheme::Https) {
        TransportEvent ev = start_tls();
        if (ev.type != TransportEvent::Type::End) return fail(std::move(ev));
    }

    st = write_all(_wire);
    if (st == IoStatus::Timeout) return fail(TransportEvent::timeout());
    if (st != IoStatus::Ok) return fail(TransportEvent::error("write " + internal::errno_name(errno)));
    _wire.clear();

    return read_head();
}

// Returns End on success, otherwise the failure event.
TransportEvent SocketExchange::start_tls() {
    if (!_tls || !_tls->ctx()) {
        rhc::log_line("[TLS-CLI] TLS ctx not ready");
        return TransportEvent::error("TLS context not ready");
    }
    SSL* s = SSL_new(_tls->ctx());
    if (!s) {
        internal::log_openssl_errors("SSL_new");
        return TransportEvent::error("SSL_new failed");
    }
    _ssl.reset(s);
    SSL_set_fd(s, _tcp.fd());

    const std::string sni = _sni.empty() ? _conn.host : _sni;
    if (!is_ip_literal(sni)) {
        SSL_set_tlsext_host_name(s, sni.c_str());
    }

    const bool custom_identity = _conn.agent && _conn.agent->check_server_identity;

    // Chain validation is not enough; the name must be checked too, unless a
    // caller-supplied identity check replaces it.
    if (_tls->verify_peer() && !custom_identity) {
        if (is_ip_literal(sni)) {
            if (X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(s), sni.c_str()) != 1) {
                internal::log_openssl_errors("X509_VERIFY_PARAM_set1_ip_asc");
                return TransportEvent::error("cannot set expected peer address");
            }
        } else if (SSL_set1_host(s, sni.c_str()) != 1) {
            internal::log_openssl_errors("SSL_set1_host");
            return TransportEvent::error("cannot set expected peer host");
        }
    }

    const int fd = _tcp.fd();
    const int old_flags = ::fcntl(fd, F_GETFL, 0);
    if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
        rhc::log_line("[TLS-CLI] fcntl(O_NONBLOCK) failed");
        return TransportEvent::error("fcntl(O_NONBLOCK) failed");
    }

    const int handshake_ms = _io_timeout_ms > 0 ? _io_timeout_ms : _connect_timeout_ms;
    const IoStatus hs = ssl_connect_with_deadline(s, fd, handshake_ms);

    // Restore original socket flags (back to blocking mode).
    (void)::fcntl(fd, F_SETFL, old_flags);

    if (hs == IoStatus::Timeout) return TransportEvent::timeout();
    if (hs != IoStatus::Ok) return TransportEvent::error("TLS handshake failed with " + _conn.host);

    if (_tls->verify_peer()) {
        const long vr = SSL_get_verify_result(s);
        if (vr != X509_V_OK) {
            const std::string why = X509_verify_cert_error_string(vr);
            rhc::log_line("[TLS-CLI] TLS verify failed: " + why);
            return TransportEvent::error(why);
        }
    }

    if (custom_identity) {
        PeerCertificate cert;
        if (!internal::read_peer_certificate(s, cert)) {
            return TransportEvent::error("Peer certificate is not available for " + _conn.host);
        }
        std::optional<std::string> reason;
        try {
            reason = _conn.agent->check_server_identity(_conn.host, cert);
        } catch (const std::exception& e) {
            reason = std::string("Server identity check failed: ") + e.what();
        }
        if (reason) {
            rhc::log_line("[TLS-CLI] " + *reason);
            return TransportEvent::error(*reason);
        }
    }
    return TransportEvent::end();
}

TransportEvent SocketExchange::read_head() {
    for (;;) {
        std::size_t hdr_end_off = 0;
        int code = 0;
        std::string text;
        Headers headers;

        while (_buf.find("\r\n\r\n") == std::string::npos) {
            const bool nothing_yet = _buf.empty();
            const IoStatus st = read_more();
            if (st == IoStatus::Closed) {
                // Peer hung up without answering at all.
                if (nothing_yet) return fail(TransportEvent::abort());
                return fail(TransportEvent::error("socket hang up"));
            }
            if (st == IoStatus::Timeout) return fail(TransportEvent::timeout());
            if (st != IoStatus::Ok) return fail(TransportEvent::error("read " + internal::errno_name(errno)));
            if (_buf.size() > _max_header) return fail(TransportEvent::error("Header overflow"));
        }

        if (!internal::parse_http_response(_buf, hdr_end_off, code, text, headers)) {
            return fail(TransportEvent::error("Parse Error: malformed response head"));
        }
        _buf.erase(0, hdr_end_off);

        // Interim responses (100 Continue, 103 Early Hints) precede the real one.
        if (code >= 100 && code < 200 && code != 101) continue;

        const std::string te = internal::lower_copy(internal::hdr_ci(headers, "transfer-encoding"));
        const std::string cl = internal::hdr_ci(headers, "content-length");
        if (code == 204 || code == 304 || (code >= 100 && code < 200)) {
            _framing = Framing::None;
        } else if (te.find("chunked") != std::string::npos) {
            _framing = Framing::Chunked;
            _remaining = 0;
        } else if (!cl.empty()) {
            if (!std::all_of(cl.begin(), cl.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
                return fail(TransportEvent::error("Parse Error: invalid Content-Length"));
            }
            try {
                _remaining = static_cast<std::size_t>(std::stoull(cl));
            } catch (const std::exception&) {
                return fail(TransportEvent::error("Parse Error: invalid Content-Length"));
            }
            _framing = _remaining == 0 ? Framing::None : Framing::Length;
        } else {
            _framing = Framing::UntilClose;
        }

        _stage = Stage::Body;
        return TransportEvent::response(code, std::move(text), std::move(headers));
    }
}

TransportEvent SocketExchange::next_body() {
    switch (_framing) {
        case Framing::None:
            return finish();

        case Framing::Length: {
            if (_remaining == 0) return finish();
            if (_buf.empty()) {
                const IoStatus st = read_more();
                if (st != IoStatus::Ok) return body_failure(st);
            }
            const std::size_t n = std::min(_buf.size(), _remaining);
            _remaining -= n;
            return take(n);
        }

        case Framing::UntilClose: {
            if (_buf.empty()) {
                const IoStatus st = read_more();
                if (st == IoStatus::Closed) return finish();
                if (st != IoStatus::Ok) return body_failure(st);
            }
            return take(_buf.size());
        }

        case Framing::Chunked:
            return next_chunked();
    }
    return finish();
}

TransportEvent SocketExchange::next_chunked() {
    for (;;) {
        if (_remaining > 0) {
            if (_buf.empty()) {
                const IoStatus st = read_more();
                if (st != IoStatus::Ok) return body_failure(st);
            }
            const std::size_t n = std::min(_buf.size(), _remaining);
            _remaining -= n;
            if (_remaining == 0) _chunk_crlf = true;
            return take(n);
        }

        if (_chunk_crlf) {
            const IoStatus st = ensure(2);
            if (st != IoStatus::Ok) return body_failure(st);
            if (_buf.compare(0, 2, "\r\n") != 0) {
                return fail(TransportEvent::error("Parse Error: invalid chunk terminator"));
            }
            _buf.erase(0, 2);
            _chunk_crlf = false;
        }

        std::size_t eol = _buf.find("\r\n");
        while (eol == std::string::npos) {
            if (_buf.size() > 4096) return fail(TransportEvent::error("Parse Error: chunk size line too long"));
            const IoStatus st = read_more();
            if (st != IoStatus::Ok) return body_failure(st);
            eol = _buf.find("\r\n");
        }
        const std::string line = _buf.substr(0, eol);
        _buf.erase(0, eol + 2);

        std::size_t size = 0;
        if (!internal::parse_chunk_size(line, size)) {
            return fail(TransportEvent::error("Parse Error: invalid chunk size"));
        }
        if (size > 0) {
            _remaining = size;
            continue;
        }

        // Last chunk: skip trailers up to the empty line.
        for (;;) {
            eol = _buf.find("\r\n");
            if (eol == std::string::npos) {
                if (_buf.size() > _max_header) return fail(TransportEvent::error("Header overflow"));
                const IoStatus st = read_more();
                if (st != IoStatus::Ok) return body_failure(st);
                continue;
            }
            const bool blank = (eol == 0);
            _buf.erase(0, eol + 2);
            if (blank) return finish();
        }
    }
}

IoStatus SocketExchange::write_all(const std::string& data) {
    if (!_ssl) return _tcp.send_all(data.data(), data.size());

    std::size_t off = 0;
    while (off < data.size()) {
        ::ERR_clear_error();
        const int n = SSL_write(_ssl.get(), data.data() + off, (int)(data.size() - off));
        if (n > 0) { off += (std::size_t)n; continue; }
        const int e = SSL_get_error(_ssl.get(), n);
        if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return IoStatus::Timeout;
        if (e == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) return IoStatus::Timeout;
        internal::log_openssl_errors("SSL_write");
        return IoStatus::Failed;
    }
    return IoStatus::Ok;
}

IoStatus SocketExchange::read_more() {
    char buf[16384];
    if (!_ssl) {
        std::size_t got = 0;
        const IoStatus st = _tcp.recv_some(buf, sizeof(buf), got);
        if (st == IoStatus::Ok) _buf.append(buf, got);
        return st;
    }

    ::ERR_clear_error();
    errno = 0;
    const int n = SSL_read(_ssl.get(), buf, (int)sizeof(buf));
    if (n > 0) {
        _buf.append(buf, (std::size_t)n);
        return IoStatus::Ok;
    }
    const int e = SSL_get_error(_ssl.get(), n);
    if (e == SSL_ERROR_ZERO_RETURN) return IoStatus::Closed;
    if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) return IoStatus::Timeout;
    if (e == SSL_ERROR_SYSCALL) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::Timeout;
        if (errno == 0) return IoStatus::Closed;   // EOF without close_notify
    }
    internal::log_openssl_errors("SSL_read");
    return IoStatus::Failed;
}

IoStatus SocketExchange::ensure(std::size_t n) {
    while (_buf.size() < n) {
        const IoStatus st = read_more();
        if (st != IoStatus::Ok) return st;
    }
    return IoStatus::Ok;
}

void validate_request(const ConnectionConfig& conn, const OutboundRequest& req) {
    if (conn.host.empty()) {
        throw ValidationError("Host must not be empty");
    }
    for (unsigned char c : conn.host) {
        if (std::isspace(c) || std::iscntrl(c) || c == '/' || c == '@') {
            throw ValidationError("Invalid host \"" + conn.host + "\"");
        }
    }
    for (unsigned char c : req.path) {
        if (c <= 0x20 || c == 0x7F) {
            throw ValidationError("Request path contains unescaped characters");
        }
    }
    for (const auto& kv : req.headers) {
        if (!internal::valid_header_name(kv.first)) {
            throw ValidationError("Header name must be a valid HTTP token [\"" + kv.first + "\"]");
        }
        if (!internal::valid_header_value(kv.second)) {
            throw ValidationError("Invalid character in header content [\"" + kv.first + "\"]");
        }
    }
}

} // namespace

SocketTransport::SocketTransport(const ClientConfig& cfg) : _cfg(cfg) {}

SocketTransport::~SocketTransport() = default;

std::shared_ptr<internal::TlsClientContext> SocketTransport::tls_context(bool verify_peer, const std::string& ca_file) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto& slot = _tls[{verify_peer, ca_file}];
    if (!slot) {
        slot = std::make_shared<internal::TlsClientContext>(verify_peer, ca_file);
    }
    return slot;
}

std::unique_ptr<Exchange> SocketTransport::open(const ConnectionConfig& conn, const OutboundRequest& req) {
    validate_request(conn, req);

    std::shared_ptr<internal::TlsClientContext> tls;
    if (conn.scheme == Scheme::Https) {
        bool verify = _cfg.tls_verify_peer;
        std::string ca = _cfg.tls_ca_file;
        if (conn.agent) {
            if (conn.agent->verify_peer) verify = *conn.agent->verify_peer;
            if (!conn.agent->ca_file.empty()) ca = conn.agent->ca_file;
        }
        tls = tls_context(verify, ca);
    }

    int io_timeout_ms = 0;
    if (req.timeout && req.timeout->count() > 0) {
        io_timeout_ms = static_cast<int>(std::min<long long>(req.timeout->count(), std::numeric_limits<int>::max()));
    }

    std::string wire = internal::build_request_head(conn, req, _cfg.user_agent);
    wire += req.body;

    return std::make_unique<SocketExchange>(conn, std::move(wire), io_timeout_ms, _cfg.connect_timeout_ms,
                                            _cfg.tls_sni, std::move(tls), _cfg.max_header_bytes);
}

} // namespace rhc
