/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/proxy_config.hpp"
#include "sp/http_request.hpp"
#include "sp/http_response.hpp"
#include "sp/router.hpp"
#include "sp/internal/http_parser.hpp"
#include "sp/internal/utils.hpp"
#include "sp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <sstream>
#include <algorithm>

namespace sp::internal {

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

static bool should_keep_alive(const sp::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Writes one response to the client socket. HEAD responses keep their
// headers but drop the body.
class FdResponseWriter : public sp::ResponseWriter {
public:
    FdResponseWriter(int fd, const sp::ProxyConfig& cfg, bool keep_alive, bool head_only)
        : _fd(fd), _cfg(cfg), _ka(keep_alive), _head_only(head_only) {}

    bool write_head(int status, const sp::HeaderList& headers) override {
        if (_head_sent || _broken) return false;
        _head_sent = true;

        bool has_len = false;
        std::ostringstream oss;
        oss << "HTTP/1.1 " << status << " " << sp::status_text(status) << "\r\n";
        for (const auto& kv : headers) {
            if (iequals(kv.first, "Content-Length")) has_len = true;
            oss << kv.first << ": " << kv.second << "\r\n";
        }
        // without a length the body can only end with the connection
        if (!has_len && status != 304 && !_head_only) _ka = false;
        if (_ka) {
            oss << "Connection: keep-alive\r\n";
            oss << "Keep-Alive: timeout=" << _cfg.ka_timeout_sec
                << ", max=" << _cfg.ka_max << "\r\n";
        } else {
            oss << "Connection: close\r\n";
        }
        oss << "\r\n";
        const std::string h = oss.str();
        if (!send_all(_fd, h.data(), h.size())) {
            _broken = true;
            return false;
        }
        return true;
    }

    bool write_body(const char* data, std::size_t len) override {
        if (!_head_sent || _broken) return false;
        if (_head_only || len == 0) return true;
        if (!send_all(_fd, data, len)) {
            _broken = true;
            return false;
        }
        return true;
    }

    void abort() override {
        _broken = true;
        ::shutdown(_fd, SHUT_RDWR);
    }

    bool keep_alive() const { return _ka && !_broken && _head_sent; }

private:
    int _fd;
    const sp::ProxyConfig& _cfg;
    bool _ka;
    bool _head_only;
    bool _head_sent = false;
    bool _broken = false;
};

// Reads one request head. Bytes past it stay in pending for the next
// request on the connection. Request bodies are read and dropped.
static bool recv_http_request(int fd,
                              const sp::ProxyConfig& cfg,
                              std::string& pending,
                              sp::HttpRequest& R)
{
    char buf[4096];
    std::size_t hdr_end;
    while ((hdr_end = pending.find("\r\n\r\n")) == std::string::npos) {
        if (pending.size() > cfg.max_header) return false; // header abuse guard
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        pending.append(buf, buf + n);
    }
    if (hdr_end > cfg.max_header) return false;

    const std::string head = pending.substr(0, hdr_end);
    pending.erase(0, hdr_end + 4);
    R = sp::HttpRequest{};
    if (!parse_request_head(head, R)) return false;

    if (has_hdr_ci(R.headers, "Transfer-Encoding")) return false;
    std::int64_t content_len = 0;
    if (has_hdr_ci(R.headers, "Content-Length")) {
        if (!parse_content_length(hdr_ci(R, "Content-Length"), content_len)) return false;
        if (content_len > static_cast<std::int64_t>(cfg.max_header)) return false;
    }
    while (static_cast<std::int64_t>(pending.size()) < content_len) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        pending.append(buf, buf + n);
    }
    pending.erase(0, static_cast<std::size_t>(content_len));
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const sp::ProxyConfig& cfg,
                             const std::string& peer_ip,
                             const sp::Router& router)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string pending;
    int served = 0;
    while (served < cfg.ka_max) {
        sp::HttpRequest R;
        if (!recv_http_request(fd, cfg, pending, R)) break;

        const bool ka = should_keep_alive(R) && (served + 1 < cfg.ka_max);
        FdResponseWriter w(fd, cfg, ka, R.method == "HEAD");
        router.route(R, peer_ip, w);
        ++served;
        if (!w.keep_alive()) break;
    }
}

} // namespace sp::internal
