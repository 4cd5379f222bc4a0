/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/fetcher.hpp"
#include "sp/internal/utils.hpp"
#include "sp/log.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace sp::internal {

static constexpr std::size_t kMaxResponseHead = 64 * 1024;
static constexpr std::size_t kMaxChunkLine    = 4 * 1024;

const char* fetch_error_name(FetchError e) {
    switch (e) {
    case FetchError::None:                  return "NONE";
    case FetchError::Timeout:               return "TIMEOUT";
    case FetchError::TooManyRedirects:      return "TOO_MANY_REDIRECTS";
    case FetchError::BlockedRedirect:       return "BLOCKED_REDIRECT";
    case FetchError::DeniedAddress:         return "DENIED_ADDRESS";
    case FetchError::MalformedContentType:  return "MALFORMED_CONTENT_TYPE";
    case FetchError::DisallowedContentType: return "DISALLOWED_CONTENT_TYPE";
    case FetchError::SizeExceeded:          return "SIZE_EXCEEDED";
    case FetchError::UpstreamUnavailable:   return "UPSTREAM_UNAVAILABLE";
    case FetchError::UpstreamStatus:        return "UPSTREAM_STATUS";
    }
    return "UNKNOWN";
}

// ---------------- BodyReader ----------------

BodyReader::BodyReader(std::unique_ptr<UpstreamConn> conn, std::string leftover,
                       Framing framing, std::int64_t length,
                       std::int64_t max_size, const Deadline& deadline)
    : _conn(std::move(conn)), _buf(std::move(leftover)), _framing(framing),
      _max(max_size), _deadline(deadline)
{
    if (_framing == Framing::Length) _left = length;
    if (_framing == Framing::Empty || (_framing == Framing::Length && length == 0)) {
        _done = true;
    }
}

ssize_t BodyReader::raw_read(char* buf, std::size_t cap, FetchError& err) {
    if (!_buf.empty()) {
        const std::size_t n = std::min(cap, _buf.size());
        std::memcpy(buf, _buf.data(), n);
        _buf.erase(0, n);
        return static_cast<ssize_t>(n);
    }
    return _conn->read_some(buf, cap, _deadline, err);
}

bool BodyReader::read_line(std::string& line, FetchError& err) {
    while (true) {
        const std::size_t eol = _buf.find("\r\n");
        if (eol != std::string::npos) {
            line = _buf.substr(0, eol);
            _buf.erase(0, eol + 2);
            return true;
        }
        if (_buf.size() > kMaxChunkLine) {
            err = FetchError::UpstreamUnavailable;
            return false;
        }
        char tmp[1024];
        const ssize_t n = _conn->read_some(tmp, sizeof(tmp), _deadline, err);
        if (n < 0) return false;
        if (n == 0) {
            err = FetchError::UpstreamUnavailable;
            return false;
        }
        _buf.append(tmp, static_cast<std::size_t>(n));
    }
}

// chunk = chunk-size [ chunk-ext ] CRLF chunk-data CRLF
bool BodyReader::next_chunk(FetchError& err) {
    std::string line;
    if (!_first_chunk) {
        if (!read_line(line, err)) return false;
        if (!line.empty()) {
            err = FetchError::UpstreamUnavailable;
            return false;
        }
    }
    _first_chunk = false;

    if (!read_line(line, err)) return false;
    const std::size_t semi = line.find(';');
    if (semi != std::string::npos) line.erase(semi);
    trim_inplace(line);
    if (line.empty() || line.size() > 15) {
        err = FetchError::UpstreamUnavailable;
        return false;
    }
    std::int64_t size = 0;
    for (char c : line) {
        const int v = hexval(c);
        if (v < 0) {
            err = FetchError::UpstreamUnavailable;
            return false;
        }
        size = size * 16 + v;
    }

    if (size == 0) {
        // trailer section ends with an empty line
        do {
            if (!read_line(line, err)) return false;
        } while (!line.empty());
        _done = true;
        return true;
    }
    _left = size;
    return true;
}

ssize_t BodyReader::read(char* buf, std::size_t cap, FetchError& err) {
    if (_done || cap == 0) return 0;

    std::size_t want = cap;
    if (_framing == Framing::Chunked && _left == 0) {
        if (!next_chunk(err)) return -1;
        if (_done) return 0;
    }
    if (_framing == Framing::Length || _framing == Framing::Chunked) {
        want = static_cast<std::size_t>(std::min<std::int64_t>(_left, static_cast<std::int64_t>(cap)));
    }

    const ssize_t n = raw_read(buf, want, err);
    if (n < 0) return -1;
    if (n == 0) {
        if (_framing != Framing::UntilClose) {
            // connection closed inside a delimited body
            err = FetchError::UpstreamUnavailable;
            return -1;
        }
        _done = true;
        return 0;
    }

    _total += n;
    if (_total > _max) {
        err = FetchError::SizeExceeded;
        return -1;
    }
    if (_framing == Framing::Length || _framing == Framing::Chunked) {
        _left -= n;
        if (_framing == Framing::Length && _left == 0) _done = true;
    }
    return n;
}

bool BodyReader::read_all(std::string& out, FetchError& err) {
    char buf[16 * 1024];
    while (true) {
        const ssize_t n = read(buf, sizeof(buf), err);
        if (n < 0) return false;
        if (n == 0) return true;
        out.append(buf, static_cast<std::size_t>(n));
    }
}

// ---------------- Fetcher ----------------

static bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Anything outside the visible ASCII range is escaped in the request target.
static std::string escape_request_target(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string o;
    o.reserve(path.size());
    for (unsigned char c : path) {
        if (c <= 0x20 || c >= 0x7F) {
            o.push_back('%');
            o.push_back(hex[c >> 4]);
            o.push_back(hex[c & 0x0F]);
        } else {
            o.push_back(static_cast<char>(c));
        }
    }
    return o;
}

static bool header_value_safe(const std::string& v) {
    return v.find_first_of("\r\n") == std::string::npos;
}

Fetcher::Fetcher(const sp::ProxyConfig& cfg, const NetworkGuard& guard,
                 Dialer& dialer, const TlsClientContext* tls)
    : _cfg(cfg), _guard(guard), _dialer(dialer), _tls(tls) {}

bool Fetcher::content_type_allowed(const std::string& mt) const {
    if (mt.compare(0, 6, "image/") == 0) return true;
    if (_cfg.allow_video && mt.compare(0, 6, "video/") == 0) return true;
    if (_cfg.allow_audio && mt.compare(0, 6, "audio/") == 0) return true;
    return false;
}

std::string Fetcher::build_request(const FetchRequest& req, const ParsedUrl& target) const {
    std::ostringstream o;
    o << req.method << ' ' << escape_request_target(target.path) << " HTTP/1.1\r\n";
    o << "Host: " << target.host_header() << "\r\n";
    o << "User-Agent: " << _cfg.server_name << "\r\n";

    static const char* kForwarded[] = {
        "Accept-Language", "Cache-Control", "If-None-Match", "If-Modified-Since"
    };
    const std::string accept = hdr_ci(req.headers, "Accept");
    if (!accept.empty() && header_value_safe(accept)) {
        o << "Accept: " << accept << "\r\n";
    } else {
        std::string def = "image/*";
        if (_cfg.allow_video) def += ", video/*";
        if (_cfg.allow_audio) def += ", audio/*";
        o << "Accept: " << def << "\r\n";
    }
    for (const char* name : kForwarded) {
        const std::string v = hdr_ci(req.headers, name);
        if (!v.empty() && header_value_safe(v)) o << name << ": " << v << "\r\n";
    }

    if (target.has_userinfo && _cfg.allow_credential_urls) {
        o << "Authorization: Basic " << base64_encode(percent_decode(target.userinfo)) << "\r\n";
    }

    if (_cfg.enable_xfwd_for && !req.client_ip.empty()) {
        std::string chain = hdr_ci(req.headers, "X-Forwarded-For");
        trim_inplace(chain);
        if (!header_value_safe(chain)) chain.clear();
        o << "X-Forwarded-For: " << (chain.empty() ? req.client_ip : chain + ", " + req.client_ip) << "\r\n";
    }

    o << "Connection: close\r\n\r\n";
    return o.str();
}

FetchResult Fetcher::fetch(const FetchRequest& req, const Deadline& deadline) const {
    FetchResult res;
    ParsedUrl cur;
    if (!parse_url(req.url, cur) || cur.host.empty()) {
        res.error = FetchError::UpstreamUnavailable;
        return res;
    }

    while (true) {
        if (cur.is_https() && (!_tls || !_tls->ctx())) {
            sp::log_line("[FETCH] no TLS context for " + cur.host);
            res.error = FetchError::UpstreamUnavailable;
            return res;
        }

        FetchError err = FetchError::None;
        const int fd = _dialer.dial(cur.host, cur.port, deadline, err);
        if (fd < 0) {
            res.error = (err == FetchError::None) ? FetchError::UpstreamUnavailable : err;
            return res;
        }
        auto conn = std::make_unique<UpstreamConn>(fd);

        if (cur.is_https() &&
            !conn->start_tls(_tls->ctx(), cur.host, _tls->verify(), deadline, err)) {
            res.error = err;
            return res;
        }

        const std::string head = build_request(req, cur);
        if (!conn->send_all(head.data(), head.size(), deadline, err)) {
            res.error = err;
            return res;
        }

        // Response head; interim 1xx responses are skipped.
        std::string raw;
        std::size_t hdr_end = std::string::npos;
        int status = 0;
        std::string reason;
        HeaderMap headers;
        while (true) {
            hdr_end = raw.find("\r\n\r\n");
            if (hdr_end == std::string::npos) {
                if (raw.size() > kMaxResponseHead) {
                    res.error = FetchError::UpstreamUnavailable;
                    return res;
                }
                char buf[4096];
                const ssize_t n = conn->read_some(buf, sizeof(buf), deadline, err);
                if (n <= 0) {
                    res.error = (n < 0) ? err : FetchError::UpstreamUnavailable;
                    return res;
                }
                raw.append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (!parse_response_head(raw.substr(0, hdr_end), status, reason, headers)) {
                sp::log_line("[FETCH] malformed response head from " + cur.host);
                res.error = FetchError::UpstreamUnavailable;
                return res;
            }
            raw.erase(0, hdr_end + 4);
            if (status >= 100 && status < 200) continue;
            break;
        }

        if (is_redirect(status) && has_hdr_ci(headers, "Location")) {
            if (res.redirects >= _cfg.max_redirects) {
                sp::log_debug("[FETCH] redirect limit reached at " + cur.str());
                res.error = FetchError::TooManyRedirects;
                return res;
            }
            ++res.redirects;

            const std::string next = resolve_reference(cur, hdr_ci(headers, "Location"));
            ParsedUrl nu;
            if (!parse_url(next, nu)) {
                res.error = FetchError::BlockedRedirect;
                return res;
            }
            const HostVerdict v = _guard.check_url(nu);
            if (v != HostVerdict::Allowed) {
                sp::log_line(std::string("[FETCH] redirect rejected (") + host_verdict_name(v) + "): " + nu.host);
                res.error = FetchError::BlockedRedirect;
                return res;
            }
            cur = nu;
            continue;
        }

        res.status = status;
        res.headers = std::move(headers);
        res.final_url = cur.str();

        if (status == 304) {
            return res;
        }
        if (status < 200 || status > 299) {
            sp::log_debug("[FETCH] upstream status " + std::to_string(status) + " from " + cur.host);
            res.error = FetchError::UpstreamStatus;
            return res;
        }

        res.content_type = hdr_ci(res.headers, "Content-Type");
        std::string media;
        if (!parse_media_type(res.content_type, media)) {
            res.error = FetchError::MalformedContentType;
            return res;
        }
        if (!content_type_allowed(media)) {
            res.error = FetchError::DisallowedContentType;
            return res;
        }

        const std::string te = lower_copy(hdr_ci(res.headers, "Transfer-Encoding"));
        const bool chunked = te.find("chunked") != std::string::npos;
        if (!chunked && has_hdr_ci(res.headers, "Content-Length")) {
            if (!parse_content_length(hdr_ci(res.headers, "Content-Length"), res.content_length)) {
                res.error = FetchError::UpstreamUnavailable;
                return res;
            }
            if (res.content_length > _cfg.max_size) {
                res.error = FetchError::SizeExceeded;
                return res;
            }
        }

        if (req.method == "HEAD" || status == 204) {
            return res;
        }

        BodyReader::Framing framing = BodyReader::Framing::UntilClose;
        if (chunked) {
            framing = BodyReader::Framing::Chunked;
            res.content_length = -1;
        } else if (res.content_length >= 0) {
            framing = BodyReader::Framing::Length;
        }
        res.body = std::make_unique<BodyReader>(std::move(conn), std::move(raw), framing,
                                                res.content_length, _cfg.max_size, deadline);
        return res;
    }
}

} // namespace sp::internal
