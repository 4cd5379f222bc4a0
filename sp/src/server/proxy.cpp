/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/proxy.hpp"
#include "sp/log.hpp"
#include "sp/internal/deadline.hpp"
#include "sp/internal/http_parser.hpp"
#include "sp/internal/url.hpp"
#include "sp/internal/url_codec.hpp"

#include <stdexcept>

namespace sp {

using internal::FetchError;
using internal::HostVerdict;

static const ProxyConfig& checked(const ProxyConfig& cfg) {
    std::string why;
    if (!validate_config(cfg, why)) {
        throw std::runtime_error("invalid configuration: " + why);
    }
    return cfg;
}

static std::unique_ptr<internal::Dialer> default_dialer(std::unique_ptr<internal::Dialer> d,
                                                        const internal::NetworkGuard& guard)
{
    if (d) return d;
    return std::make_unique<internal::TcpDialer>(guard);
}

Proxy::Proxy(const ProxyConfig& cfg, std::unique_ptr<internal::Dialer> dialer)
    : _cfg(checked(cfg)),
      _guard(_cfg),
      _tls(std::make_unique<internal::TlsClientContext>(_cfg)),
      _dialer(default_dialer(std::move(dialer), _guard)),
      _fetcher(_cfg, _guard, *_dialer, _tls.get())
{}

HeaderList Proxy::base_headers() const {
    HeaderList h;
    h.emplace_back("Server", _cfg.server_name);
    for (const auto& kv : _cfg.extra_headers) h.push_back(kv);
    return h;
}

void Proxy::send_simple(ResponseWriter& w, int status, const std::string& text) const {
    HeaderList h = base_headers();
    h.emplace_back("Content-Type", "text/plain; charset=utf-8");
    h.emplace_back("X-Content-Type-Options", "nosniff");
    h.emplace_back("Content-Length", std::to_string(text.size()));
    if (w.write_head(status, h)) {
        (void)w.write_body(text.data(), text.size());
    }
}

void Proxy::fail_fetch(ResponseWriter& w, FetchError e,
                       const std::string& peer_ip, const std::string& url)
{
    int status = 404;
    const char* text = body::kFetchError;
    switch (e) {
    case FetchError::Timeout:
        status = 504;
        text = body::kTimeout;
        break;
    case FetchError::MalformedContentType:
        status = 400;
        text = body::kBadContentType;
        break;
    case FetchError::DeniedAddress:
        text = body::kDenylist;
        break;
    default:
        break;
    }
    sp::log_line("[" + std::to_string(status) + "] ip=" + peer_ip +
                 " reason=" + internal::fetch_error_name(e) + " url=" + url);
    send_simple(w, status, text);
}

HeaderList Proxy::success_headers(const internal::FetchResult& fr) const {
    static const char* kPassthrough[] = { "Cache-Control", "ETag", "Expires", "Last-Modified" };

    HeaderList h = base_headers();
    if (!fr.content_type.empty()) h.emplace_back("Content-Type", fr.content_type);
    for (const char* name : kPassthrough) {
        if (internal::has_hdr_ci(fr.headers, name)) {
            h.emplace_back(name, internal::hdr_ci(fr.headers, name));
        }
    }
    h.emplace_back("X-Content-Type-Options", "nosniff");
    h.emplace_back("X-XSS-Protection", "1; mode=block");
    h.emplace_back("Content-Security-Policy",
                   "default-src 'none'; img-src data:; style-src 'unsafe-inline'");
    return h;
}

// Known length: headers first, then the body as it arrives. A failure
// past this point can only cut the connection.
bool Proxy::stream_body(ResponseWriter& w, internal::FetchResult& fr,
                        const std::string& peer_ip, const std::string& url)
{
    HeaderList h = success_headers(fr);
    h.emplace_back("Content-Length", std::to_string(fr.content_length));
    if (!w.write_head(200, h)) return false;

    char buf[16 * 1024];
    while (true) {
        FetchError err = FetchError::None;
        const ssize_t n = fr.body->read(buf, sizeof(buf), err);
        if (n == 0) break;
        if (n < 0) {
            sp::log_line(std::string("[ABORT] ip=") + peer_ip + " reason=" +
                         internal::fetch_error_name(err) + " url=" + url);
            w.abort();
            return false;
        }
        if (!w.write_body(buf, static_cast<std::size_t>(n))) {
            sp::log_debug("[ABORT] client went away ip=" + peer_ip);
            return false;
        }
        _bytes.fetch_add(static_cast<std::uint64_t>(n), std::memory_order_relaxed);
    }
    return true;
}

void Proxy::handle(const HttpRequest& req,
                   const std::string& enc_sig,
                   const std::string& enc_url,
                   const std::string& peer_ip,
                   ResponseWriter& w)
{
    _clients.fetch_add(1, std::memory_order_relaxed);

    // Decoding
    const internal::DecodeResult dr = internal::decode_url(_cfg.hmac_key, enc_sig, enc_url);
    if (!dr.ok) {
        sp::log_line(std::string("[400] ip=") + peer_ip + " reason=" +
                     internal::signature_error_name(dr.error));
        send_simple(w, 400, dr.error == internal::SignatureError::BadSignature
                                ? body::kBadSignature : body::kMalformedToken);
        return;
    }

    // Validating
    internal::ParsedUrl target;
    if (!internal::parse_url(dr.url, target) || target.host.empty()) {
        sp::log_line(std::string("[404] ip=") + peer_ip + " reason=BAD_URL");
        send_simple(w, 404, body::kBadHost);
        return;
    }
    internal::ParsedUrl shown_url = target;
    shown_url.userinfo.clear();
    shown_url.has_userinfo = false;
    const std::string shown = shown_url.str();

    const HostVerdict v = _guard.check_url(target);
    if (v != HostVerdict::Allowed) {
        sp::log_line(std::string("[404] ip=") + peer_ip + " reason=" +
                     internal::host_verdict_name(v) + " url=" + shown);
        const char* text = body::kBadHost;
        if (v == HostVerdict::Denylisted) text = body::kDenylist;
        if (v == HostVerdict::NotAllowlisted) text = body::kAllowlist;
        send_simple(w, 404, text);
        return;
    }

    // Fetching
    internal::FetchRequest fq;
    fq.method = (req.method == "HEAD") ? "HEAD" : "GET";
    fq.url = dr.url;
    fq.headers = req.headers;
    fq.client_ip = peer_ip;

    const internal::Deadline deadline(_cfg.request_timeout_ms);
    internal::FetchResult fr = _fetcher.fetch(fq, deadline);
    if (!fr.ok()) {
        fail_fetch(w, fr.error, peer_ip, shown);
        return;
    }

    if (fr.status == 304) {
        HeaderList h = success_headers(fr);
        (void)w.write_head(304, h);
        sp::log_line("[304] ip=" + peer_ip + " url=" + shown);
        return;
    }

    if (!fr.body) {
        // HEAD or a body-less 2xx
        HeaderList h = success_headers(fr);
        if (fr.content_length >= 0) h.emplace_back("Content-Length", std::to_string(fr.content_length));
        (void)w.write_head(fr.status, h);
        sp::log_line("[" + std::to_string(fr.status) + "] ip=" + peer_ip + " url=" + shown);
        return;
    }

    // Streaming
    if (fr.content_length >= 0) {
        if (stream_body(w, fr, peer_ip, shown)) {
            sp::log_line("[200] ip=" + peer_ip + " bytes=" + std::to_string(fr.body->delivered()) +
                         " redirects=" + std::to_string(fr.redirects) + " url=" + shown);
        }
        return;
    }

    // Unknown length: buffer within max_size so failures still get a status.
    std::string data;
    FetchError err = FetchError::None;
    if (!fr.body->read_all(data, err)) {
        fail_fetch(w, err, peer_ip, shown);
        return;
    }
    HeaderList h = success_headers(fr);
    h.emplace_back("Content-Length", std::to_string(data.size()));
    if (w.write_head(200, h) && w.write_body(data.data(), data.size())) {
        _bytes.fetch_add(data.size(), std::memory_order_relaxed);
        sp::log_line("[200] ip=" + peer_ip + " bytes=" + std::to_string(data.size()) +
                     " redirects=" + std::to_string(fr.redirects) + " url=" + shown);
    }
}

} // namespace sp
