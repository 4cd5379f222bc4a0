/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/server.hpp"
#include "sp/internal/http_parser.hpp"
#include "sp/internal/url_codec.hpp"
#include "support/test_upstream.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <memory>
#include <thread>

using sp::test::TestUpstream;
using sp::test::UpstreamReply;
using sp::test::http_response;

namespace {

const std::string kKey = "0x24FEEDFACEDEADBEEFCAFE";

sp::ProxyConfig server_config() {
    sp::ProxyConfig cfg;
    cfg.hmac_key = kKey;
    cfg.listen_addr = "127.0.0.1";
    cfg.port = 0;
    cfg.server_name = "sigproxy-test";
    cfg.request_timeout_ms = 3000;
    return cfg;
}

// Server::run() on its own thread for the lifetime of the object.
class RunningServer {
public:
    explicit RunningServer(const sp::ProxyConfig& cfg) : _srv(cfg) {
        _port = _srv.listen();
        _thread = std::thread([this] { _srv.run(); });
    }
    ~RunningServer() {
        _srv.stop();
        _thread.join();
    }

    std::uint16_t port() const { return _port; }

private:
    sp::Server _srv;
    std::uint16_t _port = 0;
    std::thread _thread;
};

struct Response {
    int status = 0;
    sp::internal::HeaderMap headers;
    std::string body;
};

class Client {
public:
    explicit Client(std::uint16_t port) {
        _fd = ::socket(AF_INET, SOCK_STREAM, 0);
        timeval tv{5, 0};
        ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_port = htons(port);
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        _connected = ::connect(_fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) == 0;
    }
    ~Client() { if (_fd >= 0) ::close(_fd); }

    bool connected() const { return _connected; }

    bool send(const std::string& s) {
        return ::send(_fd, s.data(), s.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(s.size());
    }

    bool get(const std::string& path, const std::string& extra = "") {
        return send("GET " + path + " HTTP/1.1\r\nHost: proxy\r\n" + extra + "\r\n");
    }

    // One response framed by Content-Length (or by close when absent).
    bool read_response(Response& out) {
        std::size_t end;
        while ((end = _buf.find("\r\n\r\n")) == std::string::npos) {
            if (!fill()) return false;
        }
        std::string text;
        if (!sp::internal::parse_response_head(_buf.substr(0, end), out.status, text, out.headers)) {
            return false;
        }
        _buf.erase(0, end + 4);

        std::int64_t len = -1;
        if (sp::internal::has_hdr_ci(out.headers, "Content-Length") &&
            !sp::internal::parse_content_length(sp::internal::hdr_ci(out.headers, "Content-Length"), len))
        {
            return false;
        }
        if (len < 0) {
            while (fill()) {}
            out.body.swap(_buf);
            return true;
        }
        while (_buf.size() < static_cast<std::size_t>(len)) {
            if (!fill()) return false;
        }
        out.body = _buf.substr(0, static_cast<std::size_t>(len));
        _buf.erase(0, static_cast<std::size_t>(len));
        return true;
    }

    // True once the peer has closed and nothing is left unread.
    bool closed_by_peer() {
        return _buf.empty() && !fill();
    }

private:
    bool fill() {
        char tmp[4096];
        const ssize_t n = ::recv(_fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return false;
        _buf.append(tmp, static_cast<std::size_t>(n));
        return true;
    }

    int _fd = -1;
    bool _connected = false;
    std::string _buf;
};

} // namespace

TEST(Server, HealthcheckWithKeepAlive)
{
    RunningServer rs(server_config());
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(c.get("/healthcheck"));
        Response r;
        ASSERT_TRUE(c.read_response(r));
        EXPECT_EQ(r.status, 200);
        EXPECT_EQ(r.body, "OK");
        EXPECT_EQ(sp::internal::hdr_ci(r.headers, "Server"), "sigproxy-test");
        EXPECT_EQ(sp::internal::hdr_ci(r.headers, "Connection"), "keep-alive");
    }
}

TEST(Server, ConnectionCloseIsHonoured)
{
    RunningServer rs(server_config());
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    ASSERT_TRUE(c.get("/healthcheck", "Connection: close\r\n"));
    Response r;
    ASSERT_TRUE(c.read_response(r));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(sp::internal::hdr_ci(r.headers, "Connection"), "close");
    EXPECT_TRUE(c.closed_by_peer());
}

TEST(Server, KeepAliveRequestLimit)
{
    sp::ProxyConfig cfg = server_config();
    cfg.ka_max = 2;
    RunningServer rs(cfg);
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    Response first, second;
    ASSERT_TRUE(c.get("/healthcheck"));
    ASSERT_TRUE(c.read_response(first));
    EXPECT_EQ(sp::internal::hdr_ci(first.headers, "Connection"), "keep-alive");

    ASSERT_TRUE(c.get("/healthcheck"));
    ASSERT_TRUE(c.read_response(second));
    EXPECT_EQ(sp::internal::hdr_ci(second.headers, "Connection"), "close");
    EXPECT_TRUE(c.closed_by_peer());
}

TEST(Server, PipelinedRequests)
{
    RunningServer rs(server_config());
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    ASSERT_TRUE(c.send("GET /healthcheck HTTP/1.1\r\nHost: a\r\n\r\n"
                       "GET /favicon.ico HTTP/1.1\r\nHost: a\r\n\r\n"));
    Response a, b;
    ASSERT_TRUE(c.read_response(a));
    ASSERT_TRUE(c.read_response(b));
    EXPECT_EQ(a.status, 200);
    EXPECT_EQ(b.status, 404);
    EXPECT_EQ(b.body, "404 Not Found\n");
}

TEST(Server, RejectsOtherMethods)
{
    RunningServer rs(server_config());
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    ASSERT_TRUE(c.send("DELETE /healthcheck HTTP/1.1\r\nHost: a\r\n\r\n"));
    Response r;
    ASSERT_TRUE(c.read_response(r));
    EXPECT_EQ(r.status, 405);
    EXPECT_EQ(r.body, "Method Not Allowed\n");
}

TEST(Server, ProxiesThroughRealDialer)
{
    TestUpstream up([](const sp::HttpRequest&) {
        UpstreamReply rep;
        rep.raw = http_response(200, {{"Content-Type", "image/jpeg"}}, "jpeg bytes");
        return rep;
    });
    sp::ProxyConfig cfg = server_config();
    cfg.no_ip_filtering = true;
    RunningServer rs(cfg);
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    const std::string url = up.base_url() + "/photo.jpg";
    for (const std::string& path : {sp::internal::encode_url(kKey, url),
                                    sp::internal::encode_url_hex(kKey, url)}) {
        ASSERT_TRUE(c.get(path));
        Response r;
        ASSERT_TRUE(c.read_response(r));
        EXPECT_EQ(r.status, 200);
        EXPECT_EQ(r.body, "jpeg bytes");
        EXPECT_EQ(sp::internal::hdr_ci(r.headers, "Content-Type"), "image/jpeg");
    }
    EXPECT_EQ(up.request_count(), 2u);
}

TEST(Server, LoopbackTargetIsRefused)
{
    TestUpstream up([](const sp::HttpRequest&) {
        UpstreamReply rep;
        rep.raw = http_response(200, {{"Content-Type", "image/jpeg"}}, "private");
        return rep;
    });
    RunningServer rs(server_config());
    Client c(rs.port());
    ASSERT_TRUE(c.connected());

    ASSERT_TRUE(c.get(sp::internal::encode_url(kKey, up.base_url() + "/photo.jpg")));
    Response r;
    ASSERT_TRUE(c.read_response(r));
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.body, "Bad url host\n");
    EXPECT_EQ(up.request_count(), 0u);
}

TEST(Server, StopClosesIdleConnections)
{
    auto rs = std::make_unique<RunningServer>(server_config());
    Client c(rs->port());
    ASSERT_TRUE(c.connected());
    ASSERT_TRUE(c.get("/healthcheck"));
    Response r;
    ASSERT_TRUE(c.read_response(r));

    rs.reset();
    EXPECT_TRUE(c.closed_by_peer());
}
