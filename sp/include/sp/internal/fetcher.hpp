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
#include <memory>
#include <string>
#include <sys/types.h>

#include "sp/proxy_config.hpp"
#include "sp/internal/deadline.hpp"
#include "sp/internal/dialer.hpp"
#include "sp/internal/fetch_error.hpp"
#include "sp/internal/http_parser.hpp"
#include "sp/internal/net_guard.hpp"
#include "sp/internal/tls_cli_ctx.hpp"
#include "sp/internal/upstream_conn.hpp"
#include "sp/internal/url.hpp"

namespace sp::internal {

struct FetchRequest {
    std::string method = "GET";  // GET or HEAD
    std::string url;             // decoded, already validated target
    HeaderMap   headers;         // inbound client headers
    std::string client_ip;       // peer address, for X-Forwarded-For
};

// Decodes the upstream body (Content-Length, chunked or until-close),
// counting delivered bytes against max_size. Owns the connection.
class BodyReader {
public:
    enum class Framing { Empty, Length, Chunked, UntilClose };

    BodyReader(std::unique_ptr<UpstreamConn> conn, std::string leftover,
               Framing framing, std::int64_t length,
               std::int64_t max_size, const Deadline& deadline);

    // >0 bytes, 0 at end of body, -1 with err set.
    ssize_t read(char* buf, std::size_t cap, FetchError& err);

    // Read the remaining body into out (bounded by max_size).
    bool read_all(std::string& out, FetchError& err);

    std::int64_t delivered() const { return _total; }

private:
    ssize_t raw_read(char* buf, std::size_t cap, FetchError& err);
    bool    read_line(std::string& line, FetchError& err);
    bool    next_chunk(FetchError& err);

    std::unique_ptr<UpstreamConn> _conn;
    std::string  _buf;        // bytes received but not yet consumed
    Framing      _framing;
    std::int64_t _left = 0;   // Length: bytes left; Chunked: left in chunk
    bool         _done = false;
    bool         _first_chunk = true;
    std::int64_t _total = 0;
    std::int64_t _max;
    Deadline     _deadline;
};

struct FetchResult {
    FetchError   error = FetchError::None;
    int          status = 0;
    HeaderMap    headers;            // final hop's response headers
    std::string  content_type;       // raw header value, validated
    std::int64_t content_length = -1;
    std::unique_ptr<BodyReader> body; // null for 304 and HEAD
    int          redirects = 0;
    std::string  final_url;

    bool ok() const { return error == FetchError::None; }
};

// Fetches one resource, following redirects within a single deadline.
class Fetcher {
public:
    Fetcher(const sp::ProxyConfig& cfg, const NetworkGuard& guard,
            Dialer& dialer, const TlsClientContext* tls);

    FetchResult fetch(const FetchRequest& req, const Deadline& deadline) const;

    // Outbound request head for one hop.
    std::string build_request(const FetchRequest& req, const ParsedUrl& target) const;

    // image/* always; video/* and audio/* when enabled.
    bool content_type_allowed(const std::string& media_type) const;

private:
    const sp::ProxyConfig&  _cfg;
    const NetworkGuard&     _guard;
    Dialer&                 _dialer;
    const TlsClientContext* _tls;
};

} // namespace sp::internal
