/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/net_guard.hpp"
#include "sp/log.hpp"

#include <arpa/inet.h>
#include <cstring>

namespace sp::internal {

const char* host_verdict_name(HostVerdict v) {
    switch (v) {
    case HostVerdict::Allowed:        return "ALLOWED";
    case HostVerdict::BadScheme:      return "BAD_SCHEME";
    case HostVerdict::MissingHost:    return "MISSING_HOST";
    case HostVerdict::Credentials:    return "CREDENTIAL_URL";
    case HostVerdict::LoopbackName:   return "LOOPBACK_NAME";
    case HostVerdict::BlockedAddress: return "BLOCKED_ADDRESS";
    case HostVerdict::Denylisted:     return "DENYLISTED";
    case HostVerdict::NotAllowlisted: return "NOT_ALLOWLISTED";
    }
    return "UNKNOWN";
}

NetworkGuard::NetworkGuard(const sp::ProxyConfig& cfg)
    : _cfg(cfg), _deny(cfg.deny_list), _allow(cfg.allow_list)
{
    if (!_deny.empty()) {
        sp::log_line("[INFO] Deny list: " + std::to_string(_deny.size()) + " patterns");
    }
    if (!_allow.empty()) {
        sp::log_line("[INFO] Allow list: " + std::to_string(_allow.size()) + " patterns");
    }
    if (_cfg.no_ip_filtering) {
        sp::log_line("[WARN] IP range filtering is DISABLED");
    }
}

bool NetworkGuard::is_blocked_ipv4(std::uint32_t a) {
    const std::uint32_t o1 = a >> 24;
    const std::uint32_t o2 = (a >> 16) & 0xFF;
    if (o1 == 127) return true;                       // 127.0.0.0/8
    if (o1 == 10) return true;                        // 10.0.0.0/8
    if (o1 == 172 && o2 >= 16 && o2 <= 31) return true; // 172.16.0.0/12
    if (o1 == 192 && o2 == 168) return true;          // 192.168.0.0/16
    if (o1 == 169 && o2 == 254) return true;          // 169.254.0.0/16
    if (o1 == 0) return true;                         // 0.0.0.0/8
    return false;
}

bool NetworkGuard::is_blocked_ipv6(const in6_addr& a) {
    const unsigned char* b = a.s6_addr;
    if (IN6_IS_ADDR_LOOPBACK(&a) || IN6_IS_ADDR_UNSPECIFIED(&a)) return true;
    if (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) return true; // fe80::/10
    if ((b[0] & 0xfe) == 0xfc) return true;                  // fc00::/7

    // ::ffff:a.b.c.d and the deprecated ::a.b.c.d carry an IPv4 address
    static const unsigned char zeros[10] = {0};
    if (std::memcmp(b, zeros, 10) == 0 &&
        ((b[10] == 0xff && b[11] == 0xff) || (b[10] == 0 && b[11] == 0)))
    {
        const std::uint32_t v4 = (std::uint32_t(b[12]) << 24) | (std::uint32_t(b[13]) << 16) |
                                 (std::uint32_t(b[14]) << 8) | std::uint32_t(b[15]);
        return is_blocked_ipv4(v4);
    }
    return false;
}

bool NetworkGuard::is_loopback_name(const std::string& host) {
    static const std::string kLocal = "localhost";
    if (host == kLocal || host == kLocal + ".") return true;
    const std::string suffix = "." + kLocal;
    std::string h = host;
    if (!h.empty() && h.back() == '.') h.pop_back();
    return h.size() > suffix.size() &&
           h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool NetworkGuard::literal_is_blocked(const std::string& host, bool& is_literal) {
    in_addr v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        is_literal = true;
        return is_blocked_ipv4(ntohl(v4.s_addr));
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        is_literal = true;
        return is_blocked_ipv6(v6);
    }
    is_literal = false;
    return false;
}

HostVerdict NetworkGuard::check_url(const ParsedUrl& u) const {
    if (u.host.empty()) return HostVerdict::MissingHost;
    if (u.scheme != "http" && u.scheme != "https") return HostVerdict::BadScheme;
    if (u.has_userinfo && !_cfg.allow_credential_urls) return HostVerdict::Credentials;

    if (!_cfg.no_ip_filtering) {
        if (is_loopback_name(u.host)) return HostVerdict::LoopbackName;
        bool literal = false;
        if (literal_is_blocked(u.host, literal)) return HostVerdict::BlockedAddress;
    }

    // an explicit deny always wins
    if (!_deny.empty() && _deny.matches(u.host, u.path)) return HostVerdict::Denylisted;
    if (!_allow.empty() && !_allow.matches(u.host, u.path)) return HostVerdict::NotAllowlisted;
    return HostVerdict::Allowed;
}

bool NetworkGuard::address_allowed(const sockaddr* sa) const {
    if (!sa) return false;
    if (_cfg.no_ip_filtering) return true;
    if (sa->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
        return !is_blocked_ipv4(ntohl(in->sin_addr.s_addr));
    }
    if (sa->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        return !is_blocked_ipv6(in6->sin6_addr);
    }
    return false;
}

} // namespace sp::internal
