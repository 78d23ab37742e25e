/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/internal/tls_cli_ctx.hpp"
#include "ot/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace ot::internal {

TlsClientContext::TlsClientContext(const ot::ClientHandler& handler) {
    OPENSSL_init_ssl(0, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        _ok = false;
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_last_error("set_min_proto");
    }

    // Trust store
    if (!handler.ca_file().empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, handler.ca_file().c_str(), nullptr) != 1) {
            log_last_error("load_verify_locations(CA)");
            _ok = false;
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_last_error("set_default_verify_paths");
        }
    }

    // Client certificate: only what the handler carries explicitly.
    if (handler.client_certificate_options() == ot::ClientCertificateOption::Manual &&
        !handler.client_certificates().empty()) {
        const ot::Certificate& cert = handler.client_certificates().front();
        if (SSL_CTX_use_certificate(_ctx, cert.native()) != 1) {
            log_last_error("use_certificate(client)");
            _ok = false;
        } else if (!cert.has_private_key()) {
            ot::log_line("[TLS-CLI] client certificate has no private key: " + cert.subject());
            _ok = false;
        } else {
            if (SSL_CTX_use_PrivateKey(_ctx, cert.private_key()) != 1) {
                log_last_error("use_privatekey(client)");
                _ok = false;
            } else if (SSL_CTX_check_private_key(_ctx) != 1) {
                log_last_error("check_private_key(client)");
                _ok = false;
            }
        }
    }

    // Verification
    SSL_CTX_set_verify(_ctx, handler.verify_peer() ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Enable client session cache for resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    ot::log_openssl_errors("[TLS-CLI]", where);
}

} // namespace ot::internal
