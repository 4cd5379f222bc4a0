/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/upstream_conn.hpp"
#include "sp/internal/tls_cli_ctx.hpp"
#include "sp/log.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace sp::internal {

UpstreamConn::~UpstreamConn() {
    if (_ssl) {
        SSL_free(_ssl);
        _ssl = nullptr;
    }
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

bool UpstreamConn::wait(short events, const Deadline& deadline, FetchError& err) {
    const int ms = deadline.remaining_ms();
    if (ms <= 0) {
        err = FetchError::Timeout;
        return false;
    }
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = events;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    if (pr == 0) {
        err = FetchError::Timeout;
        return false;
    }
    if (pr < 0) {
        err = FetchError::UpstreamUnavailable;
        return false;
    }
    return true;
}

bool UpstreamConn::start_tls(SSL_CTX* ctx, const std::string& host, bool verify,
                             const Deadline& deadline, FetchError& err)
{
    if (!ctx || _fd < 0) {
        err = FetchError::UpstreamUnavailable;
        return false;
    }
    _ssl = SSL_new(ctx);
    if (!_ssl) {
        log_openssl_errors("SSL_new");
        err = FetchError::UpstreamUnavailable;
        return false;
    }
    SSL_set_fd(_ssl, _fd);
    // servers that close without close_notify still end an until-close body
    SSL_set_options(_ssl, SSL_OP_IGNORE_UNEXPECTED_EOF);

    unsigned char tmp[16];
    const bool is_ip = ::inet_pton(AF_INET, host.c_str(), tmp) == 1 ||
                       ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
    if (!is_ip) {
        SSL_set_tlsext_host_name(_ssl, host.c_str());
    }

    if (verify) {
        X509_VERIFY_PARAM* param = SSL_get0_param(_ssl);
        const int rc = is_ip ? X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str())
                             : SSL_set1_host(_ssl, host.c_str());
        if (rc != 1) {
            log_openssl_errors("set expected host");
            err = FetchError::UpstreamUnavailable;
            return false;
        }
    }

    while (true) {
        ERR_clear_error();
        const int rc = SSL_connect(_ssl);
        if (rc == 1) break;

        const int ssl_err = SSL_get_error(_ssl, rc);
        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            if (!wait(ssl_err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline, err)) {
                sp::log_debug("[UPSTREAM] TLS handshake interrupted: " + host);
                return false;
            }
            continue;
        }
        log_openssl_errors("SSL_connect");
        sp::log_line("[UPSTREAM] TLS handshake failed: " + host);
        err = FetchError::UpstreamUnavailable;
        return false;
    }

    if (verify) {
        const long vr = SSL_get_verify_result(_ssl);
        if (vr != X509_V_OK) {
            sp::log_line(std::string("[UPSTREAM] TLS verify failed: ") + X509_verify_cert_error_string(vr));
            err = FetchError::UpstreamUnavailable;
            return false;
        }
    }
    return true;
}

bool UpstreamConn::send_all(const char* d, std::size_t len, const Deadline& deadline, FetchError& err) {
    std::size_t off = 0;
    while (off < len) {
        if (_ssl) {
            ERR_clear_error();
            const int n = SSL_write(_ssl, d + off, static_cast<int>(len - off));
            if (n > 0) {
                off += static_cast<std::size_t>(n);
                continue;
            }
            const int e = SSL_get_error(_ssl, n);
            if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                if (!wait(e == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline, err)) return false;
                continue;
            }
            err = FetchError::UpstreamUnavailable;
            return false;
        }

        const ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            if (!wait(POLLOUT, deadline, err)) return false;
            continue;
        }
        err = FetchError::UpstreamUnavailable;
        return false;
    }
    return true;
}

ssize_t UpstreamConn::read_some(char* buf, std::size_t cap, const Deadline& deadline, FetchError& err) {
    while (true) {
        if (deadline.expired()) {
            err = FetchError::Timeout;
            return -1;
        }
        if (_ssl) {
            ERR_clear_error();
            const int n = SSL_read(_ssl, buf, static_cast<int>(cap));
            if (n > 0) return n;
            const int e = SSL_get_error(_ssl, n);
            if (e == SSL_ERROR_ZERO_RETURN) return 0;
            if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                if (!wait(e == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline, err)) return -1;
                continue;
            }
            if (e == SSL_ERROR_SYSCALL && n == 0) return 0;
            err = FetchError::UpstreamUnavailable;
            return -1;
        }

        const ssize_t n = ::recv(_fd, buf, cap, 0);
        if (n >= 0) return n;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            if (!wait(POLLIN, deadline, err)) return -1;
            continue;
        }
        err = FetchError::UpstreamUnavailable;
        return -1;
    }
}

} // namespace sp::internal
