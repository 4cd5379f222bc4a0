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
#include <netinet/in.h>
#include <sys/socket.h>
#include "sp/proxy_config.hpp"
#include "sp/internal/host_matcher.hpp"
#include "sp/internal/url.hpp"

namespace sp::internal {

enum class HostVerdict {
    Allowed,
    BadScheme,        // not http/https
    MissingHost,
    Credentials,      // user:pass@ without allow_credential_urls
    LoopbackName,     // "localhost" and friends
    BlockedAddress,   // IP literal in a filtered range
    Denylisted,
    NotAllowlisted
};

const char* host_verdict_name(HostVerdict v);

/**
 * SSRF policy. check_url() vets the textual target of every hop;
 * address_allowed() vets each resolved address right before connect().
 * Immutable after construction.
 */
class NetworkGuard {
public:
    // Throws std::runtime_error on an unusable allow/deny pattern.
    explicit NetworkGuard(const sp::ProxyConfig& cfg);

    HostVerdict check_url(const ParsedUrl& u) const;
    bool address_allowed(const sockaddr* sa) const;

    static bool is_blocked_ipv4(std::uint32_t addr_host_order);
    static bool is_blocked_ipv6(const in6_addr& a);
    static bool is_loopback_name(const std::string& host);

    // IP literal check; false when host is not a literal.
    static bool literal_is_blocked(const std::string& host, bool& is_literal);

private:
    const sp::ProxyConfig& _cfg;
    HostMatcher _deny;
    HostMatcher _allow;
};

} // namespace sp::internal
