/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/http_parser.hpp"
#include "sp/internal/utils.hpp"
#include "sp/http_response.hpp"

#include <sstream>
#include <cctype>
#include <strings.h> // strcasecmp

namespace sp {

const char* status_text(int status) {
    switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 504: return "Gateway Timeout";
    default:  return "Unknown";
    }
}

} // namespace sp

namespace sp::internal {

// RFC 7230 tchar
static bool is_tchar(char c) {
    if (std::isalnum((unsigned char)c)) return true;
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return false;
    }
}

static bool is_token(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!is_tchar(c)) return false;
    return true;
}

// Header lines after the first line of head; joins repeats with ", ".
static bool parse_header_lines(const std::string& head, std::size_t pos, HeaderMap& headers) {
    headers.clear();
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) continue;
        // obsolete line folding is not accepted
        if (line[0] == ' ' || line[0] == '\t') return false;
        const std::size_t c = line.find(':');
        if (c == std::string::npos) return false;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        if (!is_token(k)) return false;
        trim_inplace(v);
        auto it = headers.end();
        for (auto i = headers.begin(); i != headers.end(); ++i) {
            if (strcasecmp(i->first.c_str(), k.c_str()) == 0) { it = i; break; }
        }
        if (it == headers.end()) headers.emplace(std::move(k), std::move(v));
        else it->second += ", " + v;
    }
    return true;
}

bool parse_request_line(const std::string& line, sp::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    std::string extra;
    if (iss >> extra) return false;
    if (!is_token(r.method)) return false;
    if (r.httpver != "HTTP/1.1" && r.httpver != "HTTP/1.0") return false;
    if (target.empty() || target[0] != '/') return false;
    const std::size_t q = target.find('?');
    r.path  = target.substr(0, q);
    r.query = (q == std::string::npos) ? std::string() : target.substr(q + 1);
    return true;
}

bool parse_request_head(const std::string& head, sp::HttpRequest& r) {
    const std::size_t line_end = head.find("\r\n");
    const std::string first = head.substr(0, line_end);
    if (!parse_request_line(first, r)) return false;
    if (line_end == std::string::npos) {
        r.headers.clear();
        return true;
    }
    return parse_header_lines(head, line_end + 2, r.headers);
}

bool parse_response_head(const std::string& head,
                         int& status_code,
                         std::string& status_text,
                         HeaderMap& headers)
{
    const std::size_t line_end = head.find("\r\n");
    const std::string status = head.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (status_code < 100 || status_code > 999) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    if (line_end == std::string::npos) {
        headers.clear();
        return true;
    }
    return parse_header_lines(head, line_end + 2, headers);
}

std::string hdr_ci(const HeaderMap& H, const char* name) {
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool has_hdr_ci(const HeaderMap& H, const char* name) {
    if (H.find(name) != H.end()) return true;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return true;
    }
    return false;
}

bool parse_media_type(const std::string& value, std::string& out) {
    std::string v = value;
    trim_inplace(v);

    const std::size_t semi = v.find(';');
    std::string mt = v.substr(0, semi);
    trim_inplace(mt);
    const std::size_t slash = mt.find('/');
    if (slash == std::string::npos) return false;
    const std::string type = mt.substr(0, slash);
    const std::string subtype = mt.substr(slash + 1);
    if (!is_token(type) || !is_token(subtype)) return false;

    // parameters: name=token or name="quoted"
    std::size_t pos = (semi == std::string::npos) ? v.size() : semi;
    while (pos < v.size()) {
        ++pos; // ';'
        while (pos < v.size() && (v[pos] == ' ' || v[pos] == '\t')) ++pos;
        if (pos >= v.size()) break; // trailing ';' is tolerated
        const std::size_t eq = v.find('=', pos);
        if (eq == std::string::npos) return false;
        if (!is_token(v.substr(pos, eq - pos))) return false;
        pos = eq + 1;
        if (pos < v.size() && v[pos] == '"') {
            ++pos;
            bool closed = false;
            while (pos < v.size()) {
                if (v[pos] == '\\') { pos += 2; continue; }
                if (v[pos] == '"') { closed = true; ++pos; break; }
                ++pos;
            }
            if (!closed) return false;
        } else {
            const std::size_t start = pos;
            while (pos < v.size() && is_tchar(v[pos])) ++pos;
            if (pos == start) return false;
        }
        while (pos < v.size() && (v[pos] == ' ' || v[pos] == '\t')) ++pos;
        if (pos < v.size() && v[pos] != ';') return false;
    }

    out = lower_copy(mt);
    return true;
}

bool parse_content_length(const std::string& value, std::int64_t& out) {
    if (value.empty() || value.size() > 18) return false;
    std::int64_t v = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace sp::internal
