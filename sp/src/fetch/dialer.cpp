/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/dialer.hpp"
#include "sp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace sp::internal {

namespace {

// getaddrinfo() has no timeout of its own. The lookup runs on a helper
// thread; whoever finishes last releases the shared state.
struct Resolution {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    int rc = 0;
    addrinfo* res = nullptr;

    ~Resolution() {
        if (res) freeaddrinfo(res);
    }
};

std::shared_ptr<Resolution> start_resolve(const std::string& host, std::uint16_t port) {
    auto st = std::make_shared<Resolution>();
    std::thread([st, host, port]() {
        addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        const int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
        std::lock_guard<std::mutex> lk(st->mu);
        st->rc = rc;
        st->res = res;
        st->done = true;
        st->cv.notify_all();
    }).detach();
    return st;
}

} // namespace

int connect_with_deadline(const sockaddr* sa, socklen_t len, const Deadline& deadline) {
    int s = ::socket(sa->sa_family, SOCK_STREAM, 0);
    if (s < 0) return -1;

    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
        ::close(s);
        return -1;
    }

    int ret = ::connect(s, sa, len);
    if (ret < 0 && errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd     = s;
        pfd.events = POLLOUT;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, deadline.remaining_ms());
        } while (pr < 0 && errno == EINTR);
        if (pr <= 0 || !(pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
            ::close(s);
            return -1;
        }
        int soerr = 0;
        socklen_t slen = sizeof(soerr);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
            ::close(s);
            return -1;
        }
    } else if (ret < 0) {
        ::close(s);
        return -1;
    }

    int one = 1;
    setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return s;
}

int TcpDialer::dial(const std::string& host, std::uint16_t port,
                    const Deadline& deadline, FetchError& err)
{
    auto st = start_resolve(host, port);
    {
        std::unique_lock<std::mutex> lk(st->mu);
        if (!st->cv.wait_until(lk, deadline.at(), [&] { return st->done; })) {
            sp::log_debug("[DIAL] resolve timeout: " + host);
            err = FetchError::Timeout;
            return -1;
        }
    }
    if (st->rc != 0 || !st->res) {
        sp::log_line(std::string("[DIAL] getaddrinfo failed for ") + host + ": " + gai_strerror(st->rc));
        err = FetchError::UpstreamUnavailable;
        return -1;
    }

    bool any_allowed = false;
    for (auto* p = st->res; p; p = p->ai_next) {
        if (!_guard.address_allowed(p->ai_addr)) {
            continue;
        }
        any_allowed = true;
        if (deadline.expired()) break;

        int s = connect_with_deadline(p->ai_addr, p->ai_addrlen, deadline);
        if (s >= 0) {
            err = FetchError::None;
            return s;
        }
    }

    if (!any_allowed) {
        sp::log_line("[DIAL] all addresses of " + host + " are filtered");
        err = FetchError::DeniedAddress;
    } else if (deadline.expired()) {
        err = FetchError::Timeout;
    } else {
        sp::log_line("[DIAL] connect failed: " + host);
        err = FetchError::UpstreamUnavailable;
    }
    return -1;
}

} // namespace sp::internal
