/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include "sp/internal/deadline.hpp"
#include "sp/internal/fetch_error.hpp"
#include "sp/internal/net_guard.hpp"

namespace sp::internal {

// Opens the TCP leg of an upstream connection.
class Dialer {
public:
    virtual ~Dialer() = default;

    // Returns a connected non-blocking socket owned by the caller,
    // or -1 with err set.
    virtual int dial(const std::string& host, std::uint16_t port,
                     const Deadline& deadline, FetchError& err) = 0;
};

// Resolves host, drops every address the guard refuses and connects
// to the first survivor that answers before the deadline.
class TcpDialer : public Dialer {
public:
    explicit TcpDialer(const NetworkGuard& guard) : _guard(guard) {}

    int dial(const std::string& host, std::uint16_t port,
             const Deadline& deadline, FetchError& err) override;

private:
    const NetworkGuard& _guard;
};

// Non-blocking connect bounded by the deadline. Returns the fd or -1.
int connect_with_deadline(const sockaddr* sa, socklen_t len, const Deadline& deadline);

} // namespace sp::internal
