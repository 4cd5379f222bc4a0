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
#include "sp/http_request.hpp"
#include "sp/http_response.hpp"
#include "sp/proxy.hpp"

namespace sp {

// Maps an inbound request onto the proxy or one of the service routes:
//   GET /healthcheck, GET /status (when enabled), GET /<sig>/<url>.
class Router {
public:
    explicit Router(Proxy& proxy) : _proxy(proxy) {}

    void route(const HttpRequest& req, const std::string& peer_ip, ResponseWriter& w) const;

    // Split "/<sig>/<url>"; false for anything else.
    static bool split_token_path(const std::string& path, std::string& sig, std::string& url);

private:
    Proxy& _proxy;
};

} // namespace sp
