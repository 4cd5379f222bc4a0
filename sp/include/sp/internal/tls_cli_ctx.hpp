/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "sp/proxy_config.hpp"

namespace sp::internal {

// Shared TLS client context for upstream fetches. Loads the system
// trust store (or cfg.tls_ca_file) and enables peer verification
// unless cfg.tls_verify is off. Throws std::runtime_error when no
// context can be created.
class TlsClientContext {
public:
    explicit TlsClientContext(const sp::ProxyConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify() const { return _verify; }

    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify = true;
};

// Drain the OpenSSL error stack into the log.
void log_openssl_errors(const char* where);

} // namespace sp::internal
