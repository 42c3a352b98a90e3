/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */


#include <gtest/gtest.h>

#include <openssl/pem.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "rhc/client.hpp"
#include "rhc/errors.hpp"
#include "rhc/socket_transport.hpp"
#include "loopback_server.hpp"
#include "test_support.hpp"

using namespace rhc;
using rhc::test::LoopbackServer;
using rhc::test::Peer;
using rhc::test::RecordingLogger;
using rhc::test::TestCertificate;

namespace {

struct Drained {
    std::vector<TransportEvent::Type> types;
    int status = 0;
    Headers headers;
    std::string body;
    std::string detail;
};

Drained drain(Exchange& ex) {
    Drained d;
    for (;;) {
        TransportEvent ev = ex.next();
        d.types.push_back(ev.type);
        switch (ev.type) {
            case TransportEvent::Type::Response:
                d.status = ev.status_code;
                d.headers = ev.headers;
                continue;
            case TransportEvent::Type::Data:
                d.body += ev.chunk;
                continue;
            default:
                d.detail = ev.detail;
                return d;
        }
    }
}

ConnectionConfig loopback(const LoopbackServer& srv) {
    ConnectionConfig conn;
    conn.host = "127.0.0.1";
    conn.port = srv.port();
    return conn;
}

RequestOptions at(const std::string& url) {
    RequestOptions o;
    o.host = url;
    return o;
}

} // namespace

TEST(SocketTransport, ContentLengthJsonThroughClient) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 15\r\n\r\n{\"key\":\"value\"}");
    });
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());

    Result r = client.get(at(srv.url() + "/items?x=1"));

    ASSERT_TRUE(r.ok()) << r.error->what();
    EXPECT_EQ(r.value->status_code, 200);
    EXPECT_EQ(r.value->status_message, "OK");
    EXPECT_EQ(r.value->headers.at("content-type"), "application/json");
    EXPECT_EQ(r.value->json()["key"], "value");

    const std::string req = srv.requests().at(0);
    EXPECT_EQ(req.rfind("GET /items?x=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("\r\nHost: 127.0.0.1:" + std::to_string(srv.port()) + "\r\n"), std::string::npos);
    EXPECT_NE(req.find("\r\nConnection: close\r\n"), std::string::npos);
    EXPECT_NE(req.find("\r\nUser-Agent: rhc-client/1\r\n"), std::string::npos);
}

TEST(SocketTransport, ChunkedBodyWithTrailers) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nContent-Type: text/plain\r\n\r\n");
        p.send("5\r\nhello\r\n");
        p.send("6;ext=1\r\n world\r\n");
        p.send("0\r\nX-Checksum: abc\r\n\r\n");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    EXPECT_EQ(d.types.front(), TransportEvent::Type::Response);
    EXPECT_EQ(d.types.back(), TransportEvent::Type::End);
    EXPECT_EQ(d.status, 200);
    EXPECT_EQ(d.body, "hello world");
}

TEST(SocketTransport, BodyUntilClose) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nstreamed ");
        p.send("until close");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    EXPECT_EQ(d.types.back(), TransportEvent::Type::End);
    EXPECT_EQ(d.body, "streamed until close");
}

TEST(SocketTransport, NoContentEndsImmediately) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 204 No Content\r\nX-Id: 9\r\n\r\n");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    ASSERT_EQ(d.types.size(), 2u);
    EXPECT_EQ(d.types[1], TransportEvent::Type::End);
    EXPECT_EQ(d.status, 204);
    EXPECT_EQ(d.headers.at("x-id"), "9");
    EXPECT_TRUE(d.body.empty());
}

TEST(SocketTransport, InterimResponseIsSkipped) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nok");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    EXPECT_EQ(d.status, 201);
    EXPECT_EQ(d.body, "ok");
}

TEST(SocketTransport, FormPostReachesServer) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    });
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());

    Result r = client.post(at(srv.url() + "/submit"), "", RequestBody{FormData{{"q", "a+b c"}}});

    ASSERT_TRUE(r.ok()) << r.error->what();
    EXPECT_FALSE(r.value->data.has_value());
    const std::string req = srv.requests().at(0);
    EXPECT_EQ(req.rfind("POST /submit HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("\r\nContent-Type: application/x-www-form-urlencoded\r\n"), std::string::npos);
    EXPECT_NE(req.find("\r\nContent-Length: 11\r\n"), std::string::npos);
    EXPECT_EQ(req.substr(req.size() - 11), "q=a%2Bb%20c");
}

TEST(SocketTransport, SlowServerTimesOut) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        p.send("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    });
    auto log = std::make_shared<RecordingLogger>();
    Client client(ClientConfig{}, log);
    RequestOptions o = at(srv.url());
    o.timeout = std::chrono::milliseconds(50);

    const auto t0 = std::chrono::steady_clock::now();
    Result r = client.get(o);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Timeout);
    EXPECT_STREQ(r.error->what(), "Failed due timeout reason");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(250));
    EXPECT_EQ(log->count("Failed due timeout reason"), 1u);
}

TEST(SocketTransport, SilentCloseIsAbortAndRetried) {
    LoopbackServer srv([](Peer&, const std::string&) {});
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());
    RequestOptions o = at(srv.url());
    o.max_retries = 2;

    Result r = client.get(o);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Abort);
    EXPECT_STREQ(r.error->what(), "Failed due abort reason");
    EXPECT_EQ(srv.connections(), 3u);
}

TEST(SocketTransport, PartialHeadIsHangUp) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 200 OK\r\nContent-");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    EXPECT_EQ(d.types.back(), TransportEvent::Type::Error);
    EXPECT_EQ(d.detail, "socket hang up");
}

TEST(SocketTransport, ShortBodyIsPrematureClose) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    });
    SocketTransport t{ClientConfig{}};

    auto ex = t.open(loopback(srv), OutboundRequest{});
    Drained d = drain(*ex);

    EXPECT_EQ(d.types.back(), TransportEvent::Type::Error);
    EXPECT_EQ(d.detail, "Premature close");
    EXPECT_EQ(d.body, "abc");
}

TEST(SocketTransport, RefusedConnectionNamesErrno) {
    const std::uint16_t port = rhc::test::closed_port();
    auto log = std::make_shared<RecordingLogger>();
    Client client(ClientConfig{}, log);

    Result r = client.get(at("http://127.0.0.1:" + std::to_string(port)));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Transport);
    EXPECT_EQ(std::string(r.error->what()), "connect ECONNREFUSED 127.0.0.1:" + std::to_string(port));
    EXPECT_EQ(log->count("Request failed"), 1u);
}

TEST(SocketTransport, ErrorStatusIsRetriedOverNetwork) {
    LoopbackServer srv([](Peer& p, const std::string&) {
        p.send("HTTP/1.1 503 Service Unavailable\r\nContent-Type: text/plain\r\nContent-Length: 4\r\n\r\nbusy");
    });
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());
    RequestOptions o = at(srv.url());
    o.max_retries = 1;
    o.retry_delay = std::chrono::milliseconds(10);

    Result r = client.get(o);

    ASSERT_FALSE(r.ok());
    auto* se = dynamic_cast<StatusError*>(r.error.get());
    ASSERT_NE(se, nullptr);
    EXPECT_EQ(se->response().status_message, "Service Unavailable");
    EXPECT_EQ(se->response().text(), "busy");
    EXPECT_EQ(se->response().attempts, 2u);
    EXPECT_EQ(srv.connections(), 2u);
}

TEST(SocketTransport, InvalidHeaderThrowsOnOpen) {
    SocketTransport t{ClientConfig{}};
    ConnectionConfig conn;
    conn.host = "127.0.0.1";
    OutboundRequest req;
    req.headers["Bad Name"] = "x";

    EXPECT_THROW(t.open(conn, req), ValidationError);

    req.headers.clear();
    req.headers["X-Split"] = "a\r\nInjected: 1";
    EXPECT_THROW(t.open(conn, req), ValidationError);

    conn.host = "bad host";
    req.headers.clear();
    EXPECT_THROW(t.open(conn, req), ValidationError);
}

// ---- TLS ----

class TlsLoopback : public ::testing::Test {
protected:
    static void SetUpTestSuite() { cert = new TestCertificate(); }
    static void TearDownTestSuite() { delete cert; cert = nullptr; }

    static LoopbackServer::Handler ok_json() {
        return [](Peer& p, const std::string&) {
            p.send("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 12\r\n\r\n{\"tls\":true}");
        };
    }

    static TestCertificate* cert;
};

TestCertificate* TlsLoopback::cert = nullptr;

TEST_F(TlsLoopback, PinnedFingerprintAccepted) {
    LoopbackServer srv(ok_json(), cert);
    auto log = std::make_shared<RecordingLogger>();
    ClientConfig cfg;
    cfg.tls_verify_peer = false;
    Client client(cfg, log);

    Result r = client.get(at(srv.url("https")), cert->sha256_fingerprint());

    ASSERT_TRUE(r.ok()) << r.error->what();
    EXPECT_EQ(r.value->json()["tls"], true);
    EXPECT_EQ(log->count("Checking fingerprint for host: 127.0.0.1, fingerprint is " + cert->sha256_fingerprint()), 1u);
    EXPECT_EQ(log->count("Fingerprint validated successfully"), 1u);
}

TEST_F(TlsLoopback, SlowHandshakeWithoutTimeoutCompletes) {
    // Longer than any fixed handshake cap the transport could apply on its own.
    LoopbackServer srv(ok_json(), cert, std::chrono::milliseconds(5500));
    ClientConfig cfg;
    cfg.tls_verify_peer = false;
    Client client(cfg, std::make_shared<RecordingLogger>());

    Result r = client.get(at(srv.url("https")), cert->sha256_fingerprint());

    ASSERT_TRUE(r.ok()) << r.error->what();
    EXPECT_EQ(r.value->json()["tls"], true);
    EXPECT_EQ(srv.connections(), 1u);
}

TEST_F(TlsLoopback, SlowHandshakeHonoursConnectTimeout) {
    LoopbackServer srv(ok_json(), cert, std::chrono::milliseconds(600));
    ClientConfig cfg;
    cfg.tls_verify_peer = false;
    cfg.connect_timeout_ms = 100;
    Client client(cfg, std::make_shared<RecordingLogger>());

    Result r = client.get(at(srv.url("https")), cert->sha256_fingerprint());

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Timeout);
}

TEST_F(TlsLoopback, FingerprintFormatIsNormalized) {
    LoopbackServer srv(ok_json(), cert);
    ClientConfig cfg;
    cfg.tls_verify_peer = false;
    Client client(cfg, std::make_shared<RecordingLogger>());

    std::string compact;
    for (char c : cert->sha256_fingerprint()) if (c != ':') compact.push_back((char)std::tolower((unsigned char)c));

    EXPECT_TRUE(client.get(at(srv.url("https")), compact).ok());
}

TEST_F(TlsLoopback, MismatchedFingerprintRejectsHandshake) {
    LoopbackServer srv(ok_json(), cert);
    auto log = std::make_shared<RecordingLogger>();
    ClientConfig cfg;
    cfg.tls_verify_peer = false;
    Client client(cfg, log);
    RequestOptions o = at(srv.url("https"));
    o.max_retries = 1;

    Result r = client.get(o, "00:11:22:33");

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Transport);
    EXPECT_STREQ(r.error->what(), "Fingerprint for host 127.0.0.1 does not match");
    EXPECT_EQ(log->count("Failed to validate fingerprint"), 2u);
    EXPECT_EQ(log->meta_of("Failed to validate fingerprint", "reason"), "Fingerprint for host 127.0.0.1 does not match");
}

TEST_F(TlsLoopback, UntrustedChainFailsWhenVerifying) {
    LoopbackServer srv(ok_json(), cert);
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());

    Result r = client.get(at(srv.url("https")), cert->sha256_fingerprint());

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Transport);
}

TEST_F(TlsLoopback, AgentCaFileWithPinReplacesNameCheck) {
    char path[] = "/tmp/rhc_test_ca_XXXXXX";
    const int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    FILE* f = ::fdopen(fd, "w");
    ASSERT_NE(f, nullptr);
    PEM_write_X509(f, cert->cert());
    std::fclose(f);

    LoopbackServer srv(ok_json(), cert);
    Client client(ClientConfig{}, std::make_shared<RecordingLogger>());
    RequestOptions o = at(srv.url("https"));
    o.agent = TlsAgentOptions{};
    o.agent->ca_file = path;

    // The certificate names "localhost"; the pin stands in for the host check.
    Result pinned = client.get(o, cert->sha256_fingerprint());
    Result unpinned = client.get(o);
    std::remove(path);

    ASSERT_TRUE(pinned.ok()) << pinned.error->what();
    ASSERT_FALSE(unpinned.ok());
    EXPECT_EQ(unpinned.error->kind(), ErrorKind::Transport);
}
