/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/proxy_config.hpp"
#include "sp/internal/utils.hpp"
#include "sp/log.hpp"

#include <fstream>

namespace sp {

bool load_pattern_file(const std::string& path, std::vector<std::string>& out) {
    std::ifstream in(path);
    if (!in.good()) {
        sp::log_line("[CONFIG] failed to open pattern file: " + path);
        return false;
    }
    std::vector<std::string> tmp;
    for (std::string line; std::getline(in, line); ) {
        internal::trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;
        tmp.push_back(line);
    }
    out.insert(out.end(), tmp.begin(), tmp.end());
    sp::log_line("[CONFIG] " + path + ": " + std::to_string(tmp.size()) + " patterns");
    return true;
}

bool parse_header_arg(const std::string& arg, std::pair<std::string,std::string>& out) {
    const std::size_t c = arg.find(':');
    if (c == std::string::npos) return false;
    std::string k = arg.substr(0, c), v = arg.substr(c + 1);
    internal::trim_inplace(k);
    internal::trim_inplace(v);
    if (k.empty()) return false;
    // no header injection through the command line either
    if (k.find_first_of("\r\n ") != std::string::npos) return false;
    if (v.find_first_of("\r\n") != std::string::npos) return false;
    out = {k, v};
    return true;
}

bool validate_config(const ProxyConfig& cfg, std::string& why) {
    if (cfg.hmac_key.empty()) {
        why = "HMAC key is required";
        return false;
    }
    if (cfg.max_size <= 0) {
        why = "max size must be positive";
        return false;
    }
    if (cfg.request_timeout_ms <= 0) {
        why = "request timeout must be positive";
        return false;
    }
    if (cfg.max_redirects < 0) {
        why = "max redirects must not be negative";
        return false;
    }
    if (cfg.server_name.empty() ||
        cfg.server_name.find_first_of("\r\n") != std::string::npos)
    {
        why = "server name must be a non-empty single line";
        return false;
    }
    if (cfg.ka_max <= 0 || cfg.ka_timeout_sec <= 0) {
        why = "keep-alive limits must be positive";
        return false;
    }
    return true;
}

} // namespace sp
