/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace ot {

// How a handler finds the client certificate presented during the TLS handshake.
enum class ClientCertificateOption {
    Manual,     // only certificates in ClientHandler::client_certificates
    Automatic   // platform certificate discovery
};

enum class DecompressionMethods : std::uint8_t {
    None    = 0,
    GZip    = 1 << 0,
    Deflate = 1 << 1,
    Brotli  = 1 << 2,
    All     = GZip | Deflate | Brotli
};

enum class ClientAuthenticationMethod {
    ClientSecretBasic,
    SelfSignedTlsClientAuth,
    TlsClientAuth
};

// Wire names ("client_secret_basic", "self_signed_tls_client_auth", "tls_client_auth").
const char* to_string(ClientAuthenticationMethod m);
bool parse_client_authentication_method(const std::string& s, ClientAuthenticationMethod& out);

} // namespace ot
