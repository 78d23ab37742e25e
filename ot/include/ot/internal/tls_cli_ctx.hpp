/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include "ot/handlers.hpp"

namespace ot::internal {

// TLS client context for a ClientHandler. Loads system CA or custom CA and,
// in Manual mode, the first attached client certificate and its key.
class TlsClientContext {
public:
    explicit TlsClientContext(const ot::ClientHandler& handler);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool ok() const { return _ctx != nullptr && _ok; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _ok = true;
    void log_last_error(const char* where);
};

} // namespace ot::internal
