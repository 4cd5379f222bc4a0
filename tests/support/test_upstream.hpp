/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <utility>

#include "sp/http_request.hpp"

namespace sp::test {

// What the scripted upstream does with one request.
struct UpstreamReply {
    std::string raw;          // bytes written back verbatim
    int delay_ms = 0;         // wait before writing anything
    int hold_ms = 0;          // keep the connection open after writing
};

// Build a complete HTTP/1.1 response with Content-Length.
std::string http_response(int status,
                          const std::vector<std::pair<std::string, std::string>>& headers,
                          const std::string& body);

// Loopback HTTP origin driven by a callback. One thread per connection;
// every delay is cut short when the server is destroyed.
class TestUpstream {
public:
    using Handler = std::function<UpstreamReply(const sp::HttpRequest&)>;

    explicit TestUpstream(Handler h);
    ~TestUpstream();

    TestUpstream(const TestUpstream&) = delete;
    TestUpstream& operator=(const TestUpstream&) = delete;

    std::uint16_t port() const { return _port; }
    std::string base_url() const;

    std::vector<sp::HttpRequest> requests() const;
    std::size_t request_count() const;

private:
    void accept_loop();
    void serve(int fd);
    // false when the server is shutting down
    bool sleep_ms(int ms);

    Handler _handler;
    int _listen_fd = -1;
    std::uint16_t _port = 0;
    bool _stop = false;

    mutable std::mutex _mu;
    std::condition_variable _cv;
    std::vector<sp::HttpRequest> _requests;
    std::vector<int> _conns;
    std::vector<std::thread> _threads;
    std::thread _acceptor;
};

} // namespace sp::test
