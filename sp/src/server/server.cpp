/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/server.hpp"
#include "sp/log.hpp"

#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace sp::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
void handle_connection_plain(int fd,
                             const sp::ProxyConfig& cfg,
                             const std::string& peer_ip,
                             const sp::Router& router);

} // namespace sp::internal

namespace sp {

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

Server::Server(const ProxyConfig& cfg, std::unique_ptr<internal::Dialer> dialer)
    : _cfg(cfg), _proxy(_cfg, std::move(dialer)), _router(_proxy)
{}

Server::~Server() {
    stop();
    // connection threads reference this object
    std::unique_lock<std::mutex> lk(_conn_mu);
    _conn_cv.wait(lk, [this] { return _conns.empty(); });
}

void Server::track(int fd) {
    std::lock_guard<std::mutex> lk(_conn_mu);
    _conns.insert(fd);
}

void Server::untrack(int fd) {
    std::lock_guard<std::mutex> lk(_conn_mu);
    _conns.erase(fd);
    _conn_cv.notify_all();
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    const int lfd = _listen_fd.load();
    if (lfd >= 0) {
        ::shutdown(lfd, SHUT_RDWR);
    }
    std::lock_guard<std::mutex> lk(_conn_mu);
    for (int fd : _conns) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

std::uint16_t Server::listen() {
    if (_listen_fd >= 0) {
        throw std::runtime_error("listener already open");
    }

    in6_addr a6{};
    in_addr  a4{};
    const bool v6 = inet_pton(AF_INET6, _cfg.listen_addr.c_str(), &a6) == 1;
    if (!v6 && inet_pton(AF_INET, _cfg.listen_addr.c_str(), &a4) != 1) {
        throw std::runtime_error("bad listen address: " + _cfg.listen_addr);
    }

    int srv = ::socket(v6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        sp::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_storage ss{};
    socklen_t slen = 0;
    if (v6) {
        auto* addr = reinterpret_cast<sockaddr_in6*>(&ss);
        addr->sin6_family = AF_INET6;
        addr->sin6_addr = a6;
        addr->sin6_port = htons(_cfg.port);
        slen = sizeof(sockaddr_in6);
    } else {
        auto* addr = reinterpret_cast<sockaddr_in*>(&ss);
        addr->sin_family = AF_INET;
        addr->sin_addr = a4;
        addr->sin_port = htons(_cfg.port);
        slen = sizeof(sockaddr_in);
    }

    if (bind(srv, reinterpret_cast<sockaddr*>(&ss), slen) < 0) {
        sp::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (::listen(srv, 512) < 0) {
        sp::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_storage bound{};
    socklen_t blen = sizeof(bound);
    std::uint16_t port = _cfg.port;
    if (getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        port = ntohs(bound.ss_family == AF_INET6
                         ? reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port
                         : reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }

    _listen_fd = srv;
    _bound_port = port;
    return port;
}

void Server::run() {
    sp::log_line("[INFO] SigProxy starting...");
    sp::log_line("[INFO] Max size: " + std::to_string(_cfg.max_size / 1024) + " KB, timeout " +
                 std::to_string(_cfg.request_timeout_ms) + " ms, max redirects " +
                 std::to_string(_cfg.max_redirects));
    sp::log_line(std::string("[INFO] Video: ") + (_cfg.allow_video ? "on" : "off") +
                 ", audio: " + (_cfg.allow_audio ? "on" : "off") +
                 ", credential urls: " + (_cfg.allow_credential_urls ? "on" : "off") +
                 ", X-Forwarded-For: " + (_cfg.enable_xfwd_for ? "on" : "off"));
    sp::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    if (_listen_fd < 0) (void)listen();
    sp::log_line("[INFO] Listening HTTP on " + _cfg.listen_addr + ":" + std::to_string(_bound_port));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(_listen_fd, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        track(fd);
        if (_stop.load(std::memory_order_relaxed)) {
            ::shutdown(fd, SHUT_RDWR);
        }

        // Detach a per-connection handler; it owns the fd.
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer, this->_router);
            this->untrack(fd);
            ::close(fd);
        }).detach();
    }

    ::close(_listen_fd.exchange(-1));
}

} // namespace sp
