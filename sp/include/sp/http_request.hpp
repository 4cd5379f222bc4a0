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

namespace sp {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "HEAD", ...
    std::string path;     // "/<sig>/<url>"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
};

} // namespace sp
