/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstdint>

namespace sp::internal {

// Absolute http(s) URL split into the parts the fetcher needs.
struct ParsedUrl {
    std::string scheme;    // lower-case, empty if the input had none
    std::string userinfo;  // raw "user:pass", empty if absent
    bool has_userinfo = false;
    std::string host;      // lower-case; IPv6 literals without brackets
    std::uint16_t port = 0;
    bool has_port = false;
    std::string path;      // path + query, never empty when host is set

    bool is_https() const { return scheme == "https"; }
    bool host_is_ipv6() const { return host.find(':') != std::string::npos; }

    // "host[:port]" as sent in the Host header (default ports omitted).
    std::string host_header() const;

    // Re-assembled URL without fragment.
    std::string str() const;
};

// Parse an URL. Relative references parse with empty scheme and host.
// Returns false only on malformed authority (bad port, bad host bytes,
// unterminated IPv6 literal).
bool parse_url(const std::string& s, ParsedUrl& out);

// Resolve a Location header value against the URL that produced it.
std::string resolve_reference(const ParsedUrl& base, const std::string& ref);

// Percent-decode (no '+' handling).
std::string percent_decode(const std::string& s);

} // namespace sp::internal
