/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/url.hpp"
#include "sp/internal/utils.hpp"

#include <cctype>
#include <vector>

namespace sp::internal {

static std::uint16_t default_port(const std::string& scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

static bool valid_reg_name_char(char c) {
    return std::isalnum((unsigned char)c) || c == '-' || c == '.' || c == '_';
}

static bool valid_ipv6_char(char c) {
    return std::isxdigit((unsigned char)c) || c == ':' || c == '.';
}

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
static std::size_t scheme_length(const std::string& s) {
    if (s.empty() || !std::isalpha((unsigned char)s[0])) return 0;
    for (std::size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ':') return i;
        if (!std::isalnum((unsigned char)c) && c != '+' && c != '-' && c != '.') return 0;
    }
    return 0;
}

static bool parse_authority(const std::string& auth, ParsedUrl& out) {
    std::string hostport = auth;
    const std::size_t at = auth.rfind('@');
    if (at != std::string::npos) {
        out.userinfo = auth.substr(0, at);
        out.has_userinfo = true;
        hostport = auth.substr(at + 1);
    }

    std::string host, port;
    if (!hostport.empty() && hostport[0] == '[') {
        const std::size_t close = hostport.find(']');
        if (close == std::string::npos) return false;
        host = hostport.substr(1, close - 1);
        if (host.empty()) return false;
        for (char c : host) if (!valid_ipv6_char(c)) return false;
        const std::string rest = hostport.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return false;
            port = rest.substr(1);
            out.has_port = true;
        }
    } else {
        const std::size_t colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            out.has_port = true;
        } else {
            host = hostport;
        }
        for (char c : host) if (!valid_reg_name_char(c)) return false;
    }

    if (out.has_port) {
        if (port.empty()) {
            // "host:" means the default port
            out.has_port = false;
        } else {
            if (port.size() > 5) return false;
            unsigned long v = 0;
            for (char c : port) {
                if (!std::isdigit((unsigned char)c)) return false;
                v = v * 10 + static_cast<unsigned long>(c - '0');
            }
            if (v == 0 || v > 65535) return false;
            out.port = static_cast<std::uint16_t>(v);
        }
    }

    out.host = lower_copy(host);
    return true;
}

bool parse_url(const std::string& s, ParsedUrl& out) {
    out = ParsedUrl{};
    std::string rest = s;

    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);

    const std::size_t slen = scheme_length(rest);
    if (slen > 0) {
        out.scheme = lower_copy(rest.substr(0, slen));
        rest.erase(0, slen + 1);
    }

    if (rest.compare(0, 2, "//") == 0) {
        rest.erase(0, 2);
        const std::size_t end = rest.find_first_of("/?");
        const std::string auth = rest.substr(0, end);
        rest = (end == std::string::npos) ? std::string() : rest.substr(end);
        if (!parse_authority(auth, out)) return false;
    }

    if (!out.has_port) out.port = default_port(out.scheme);

    if (rest.empty() || rest[0] == '?') rest.insert(0, "/");
    out.path = rest;
    return true;
}

std::string ParsedUrl::host_header() const {
    std::string h = host_is_ipv6() ? "[" + host + "]" : host;
    if (has_port && port != default_port(scheme)) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string ParsedUrl::str() const {
    std::string s = scheme + "://";
    if (has_userinfo) s += userinfo + "@";
    s += host_header();
    s += path;
    return s;
}

// RFC 3986 5.2.4, applied to the path part only (query kept verbatim).
static std::string remove_dot_segments(const std::string& path_query) {
    const std::size_t q = path_query.find('?');
    const std::string path = path_query.substr(0, q);
    const std::string query = (q == std::string::npos) ? std::string() : path_query.substr(q);

    std::vector<std::string> out;
    std::size_t pos = 1; // skip the leading '/'
    bool trailing_slash = false;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        const std::string seg = path.substr(pos, next - pos);
        trailing_slash = false;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailing_slash = true;
        } else if (seg == ".") {
            trailing_slash = true;
        } else {
            out.push_back(seg);
        }
        pos = next + 1;
    }

    std::string res;
    for (const auto& seg : out) res += "/" + seg;
    if (res.empty() || trailing_slash) res += "/";
    return res + query;
}

std::string resolve_reference(const ParsedUrl& base, const std::string& ref) {
    if (scheme_length(ref) > 0) return ref;

    const std::string origin_scheme = base.scheme.empty() ? "http" : base.scheme;
    if (ref.compare(0, 2, "//") == 0) return origin_scheme + ":" + ref;

    std::string origin = origin_scheme + "://";
    if (base.has_userinfo) origin += base.userinfo + "@";
    origin += base.host_header();

    if (ref.empty()) return origin + base.path;
    if (ref[0] == '/') return origin + remove_dot_segments(ref);
    if (ref[0] == '?') {
        return origin + base.path.substr(0, base.path.find('?')) + ref;
    }

    const std::string base_path = base.path.substr(0, base.path.find('?'));
    const std::size_t last = base_path.rfind('/');
    const std::string dir = (last == std::string::npos) ? "/" : base_path.substr(0, last + 1);
    return origin + remove_dot_segments(dir + ref);
}

std::string percent_decode(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hexval(s[i+1]), lo = hexval(s[i+2]);
            if (hi >= 0 && lo >= 0) {
                o.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        o.push_back(s[i]);
    }
    return o;
}

} // namespace sp::internal
