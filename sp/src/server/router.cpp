/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/router.hpp"
#include "sp/log.hpp"

#include <sstream>

namespace sp {

bool Router::split_token_path(const std::string& path, std::string& sig, std::string& url) {
    if (path.size() < 4 || path[0] != '/') return false;
    const std::size_t slash = path.find('/', 1);
    if (slash == std::string::npos) return false;
    sig = path.substr(1, slash - 1);
    url = path.substr(slash + 1);
    if (sig.empty() || url.empty()) return false;
    return url.find('/') == std::string::npos;
}

void Router::route(const HttpRequest& req, const std::string& peer_ip, ResponseWriter& w) const {
    if (req.method != "GET" && req.method != "HEAD") {
        sp::log_line("[405] ip=" + peer_ip + " method=" + req.method);
        _proxy.send_simple(w, 405, body::kBadMethod);
        return;
    }

    if (req.path == "/healthcheck") {
        _proxy.send_simple(w, 200, "OK");
        return;
    }
    if (req.path == "/status" && _proxy.config().stats_enabled) {
        std::ostringstream os;
        os << "ClientsServed, BytesServed\n"
           << _proxy.clients_served() << ", " << _proxy.bytes_served() << "\n";
        _proxy.send_simple(w, 200, os.str());
        return;
    }

    std::string sig, url;
    if (req.path == "/favicon.ico" || !split_token_path(req.path, sig, url)) {
        sp::log_debug("[404] ip=" + peer_ip + " path=" + req.path);
        _proxy.send_simple(w, 404, body::kNotFound);
        return;
    }

    _proxy.handle(req, sig, url, peer_ip, w);
}

} // namespace sp
