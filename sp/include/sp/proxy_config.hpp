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
#include <vector>
#include <utility>
#include <cstdint>

namespace sp {

// Built once at startup, then shared read-only by every request thread.
struct ProxyConfig {
    // Signing
    std::string hmac_key;

    // Fetch limits
    std::int64_t max_size = 5120 * 1024;  // bytes
    int request_timeout_ms = 4000;        // whole fetch: connect, redirects, body
    int max_redirects = 3;

    // Identity (Server header, upstream User-Agent)
    std::string server_name = "sigproxy";

    // Policy
    bool allow_video = false;
    bool allow_audio = false;
    bool allow_credential_urls = false;
    bool enable_xfwd_for = false;
    bool no_ip_filtering = false;          // testing only

    std::vector<std::string> allow_list;   // glob patterns
    std::vector<std::string> deny_list;    // glob patterns

    // Upstream TLS
    bool        tls_verify = true;
    std::string tls_ca_file;               // system store when empty

    // Listener
    std::string listen_addr = "0.0.0.0";
    uint16_t    port = 8080;
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;
    std::size_t max_header = 16 * 1024;

    // Router
    std::vector<std::pair<std::string,std::string>> extra_headers;
    bool stats_enabled = false;
};

// Read one pattern per line; blank lines and '#' comments are skipped.
bool load_pattern_file(const std::string& path, std::vector<std::string>& out);

// Parse "Name: value" (as given to --header).
bool parse_header_arg(const std::string& arg, std::pair<std::string,std::string>& out);

// Returns false and fills why on an unusable configuration.
bool validate_config(const ProxyConfig& cfg, std::string& why);

} // namespace sp
