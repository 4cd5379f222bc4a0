/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include "sp/proxy_config.hpp"
#include "sp/proxy.hpp"
#include "sp/router.hpp"

namespace sp {

// Plain HTTP listener in front of the proxy (thread per connection).
class Server {
public:
    explicit Server(const ProxyConfig& cfg,
                    std::unique_ptr<internal::Dialer> dialer = nullptr);
    ~Server();

    // Bind and listen; returns the bound port (useful with port 0).
    // Throws std::runtime_error on socket errors.
    std::uint16_t listen();

    // Blocking accept loop; calls listen() first if needed.
    void run();

    // Unblocks run() and shuts down open client connections.
    void stop();

    Proxy& proxy() { return _proxy; }

private:
    ProxyConfig _cfg;
    Proxy  _proxy;
    Router _router;
    std::atomic<int> _listen_fd{-1};
    std::uint16_t _bound_port = 0;
    std::atomic<bool> _stop{false};

    // open client sockets, so stop() can shut them down
    std::mutex _conn_mu;
    std::condition_variable _conn_cv;
    std::set<int> _conns;

    void track(int fd);
    void untrack(int fd);
};

} // namespace sp
