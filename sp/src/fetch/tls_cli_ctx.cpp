/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/tls_cli_ctx.hpp"
#include "sp/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <stdexcept>

namespace sp::internal {

void log_openssl_errors(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        sp::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

TlsClientContext::TlsClientContext(const sp::ProxyConfig& cfg)
    : _verify(cfg.tls_verify)
{
    OPENSSL_init_ssl(0, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        log_openssl_errors("SSL_CTX_new");
        throw std::runtime_error("TLS client context creation failed");
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_openssl_errors("set_min_proto");
    }

    // Trust store
    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            log_openssl_errors("load_verify_locations(CA)");
            SSL_CTX_free(_ctx);
            _ctx = nullptr;
            throw std::runtime_error("cannot load CA file: " + cfg.tls_ca_file);
        }
    } else if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
        log_openssl_errors("set_default_verify_paths");
    }

    SSL_CTX_set_verify(_ctx, _verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    if (!_verify) {
        sp::log_line("[WARN] upstream TLS certificate verification is DISABLED");
    }

    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

} // namespace sp::internal
