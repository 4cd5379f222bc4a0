/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <cstddef>
#include <string>
#include <sys/types.h>
#include "sp/internal/deadline.hpp"
#include "sp/internal/fetch_error.hpp"

namespace sp::internal {

// One upstream connection: a non-blocking socket, optionally wrapped
// in TLS. Every blocking step waits with poll() for at most the
// remaining time of the shared deadline.
class UpstreamConn {
public:
    explicit UpstreamConn(int fd) : _fd(fd) {}
    ~UpstreamConn();

    UpstreamConn(const UpstreamConn&) = delete;
    UpstreamConn& operator=(const UpstreamConn&) = delete;

    // Handshake with SNI; with verify on, the certificate must match host.
    bool start_tls(SSL_CTX* ctx, const std::string& host, bool verify,
                   const Deadline& deadline, FetchError& err);

    bool send_all(const char* d, std::size_t len, const Deadline& deadline, FetchError& err);

    // >0 bytes read, 0 on orderly EOF, -1 on failure (err set).
    ssize_t read_some(char* buf, std::size_t cap, const Deadline& deadline, FetchError& err);

private:
    // Wait for readiness; false with err set on timeout or poll failure.
    bool wait(short events, const Deadline& deadline, FetchError& err);

    int  _fd = -1;
    SSL* _ssl = nullptr;
};

} // namespace sp::internal
