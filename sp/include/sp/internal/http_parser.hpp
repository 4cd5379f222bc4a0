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
#include <unordered_map>
#include <cstdint>
#include "sp/http_request.hpp"

namespace sp::internal {

using HeaderMap = std::unordered_map<std::string, std::string>;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, sp::HttpRequest& r);

// Parse request line + header lines (without the terminating empty line)
bool parse_request_head(const std::string& head, sp::HttpRequest& r);

// Parse "HTTP/1.1 200 OK" + header lines (without the terminating empty line).
// Repeated headers are joined with ", ".
bool parse_response_head(const std::string& head,
                         int& status_code,
                         std::string& status_text,
                         HeaderMap& headers);

// Case-insensitive header lookup
std::string hdr_ci(const HeaderMap& H, const char* name);
bool has_hdr_ci(const HeaderMap& H, const char* name);
inline std::string hdr_ci(const sp::HttpRequest& R, const char* name) {
    return hdr_ci(R.headers, name);
}

// RFC 7231 media type: type "/" subtype *( OWS ";" OWS name "=" value ).
// On success out holds the lower-cased "type/subtype".
bool parse_media_type(const std::string& value, std::string& out);

// Decimal Content-Length; rejects signs, blanks and overflow.
bool parse_content_length(const std::string& value, std::int64_t& out);

} // namespace sp::internal
