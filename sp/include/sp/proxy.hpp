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
#include <cstdint>
#include <memory>
#include <string>

#include "sp/proxy_config.hpp"
#include "sp/http_request.hpp"
#include "sp/http_response.hpp"
#include "sp/internal/dialer.hpp"
#include "sp/internal/fetcher.hpp"
#include "sp/internal/net_guard.hpp"
#include "sp/internal/tls_cli_ctx.hpp"

namespace sp {

// Stable response bodies.
namespace body {
inline constexpr const char* kBadSignature   = "Bad Signature\n";
inline constexpr const char* kMalformedToken = "Malformed Token\n";
inline constexpr const char* kBadContentType = "Unsupported Content-Type\n";
inline constexpr const char* kNotFound       = "404 Not Found\n";
inline constexpr const char* kBadHost        = "Bad url host\n";
inline constexpr const char* kDenylist       = "Denylist host failure\n";
inline constexpr const char* kAllowlist      = "Allowlist host failure\n";
inline constexpr const char* kFetchError     = "Error Fetching Resource\n";
inline constexpr const char* kTimeout        = "Gateway Timeout\n";
inline constexpr const char* kBadMethod      = "Method Not Allowed\n";
} // namespace body

/**
 * Signed-URL proxy handler.
 *
 * One call to handle() serves one "/<sig>/<url>" request:
 * decode the token, validate the target, fetch it within a single
 * deadline and stream the body back. The object is immutable after
 * construction except for its atomic counters, so any number of
 * connection threads may share it.
 *
 * Throws std::runtime_error on an unusable configuration.
 */
class Proxy {
public:
    explicit Proxy(const ProxyConfig& cfg,
                   std::unique_ptr<internal::Dialer> dialer = nullptr);

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    void handle(const HttpRequest& req,
                const std::string& enc_sig,
                const std::string& enc_url,
                const std::string& peer_ip,
                ResponseWriter& w);

    // Plain-text response carrying the Server and configured extra headers.
    void send_simple(ResponseWriter& w, int status, const std::string& text) const;

    // Server + configured extra headers.
    HeaderList base_headers() const;

    const ProxyConfig& config() const { return _cfg; }
    std::uint64_t clients_served() const { return _clients.load(std::memory_order_relaxed); }
    std::uint64_t bytes_served() const { return _bytes.load(std::memory_order_relaxed); }

private:
    void fail_fetch(ResponseWriter& w, internal::FetchError e,
                    const std::string& peer_ip, const std::string& url);
    HeaderList success_headers(const internal::FetchResult& fr) const;
    bool stream_body(ResponseWriter& w, internal::FetchResult& fr,
                     const std::string& peer_ip, const std::string& url);

    const ProxyConfig _cfg;
    internal::NetworkGuard _guard;
    std::unique_ptr<internal::TlsClientContext> _tls;
    std::unique_ptr<internal::Dialer> _dialer;
    internal::Fetcher _fetcher;

    std::atomic<std::uint64_t> _clients{0};
    std::atomic<std::uint64_t> _bytes{0};
};

} // namespace sp
