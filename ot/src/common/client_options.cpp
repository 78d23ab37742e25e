/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/client_options.hpp"

namespace ot {

const char* to_string(ClientAuthenticationMethod m) {
    switch (m) {
    case ClientAuthenticationMethod::ClientSecretBasic:       return "client_secret_basic";
    case ClientAuthenticationMethod::SelfSignedTlsClientAuth: return "self_signed_tls_client_auth";
    case ClientAuthenticationMethod::TlsClientAuth:           return "tls_client_auth";
    }
    return "unknown";
}

bool parse_client_authentication_method(const std::string& s, ClientAuthenticationMethod& out) {
    if (s == "client_secret_basic")         { out = ClientAuthenticationMethod::ClientSecretBasic;       return true; }
    if (s == "self_signed_tls_client_auth") { out = ClientAuthenticationMethod::SelfSignedTlsClientAuth; return true; }
    if (s == "tls_client_auth")             { out = ClientAuthenticationMethod::TlsClientAuth;           return true; }
    return false;
}

void register_client_authentication_methods(ClientOptions& options) {
    options.client_authentication_methods.insert(ClientAuthenticationMethod::ClientSecretBasic);
    options.client_authentication_methods.insert(ClientAuthenticationMethod::SelfSignedTlsClientAuth);
    options.client_authentication_methods.insert(ClientAuthenticationMethod::TlsClientAuth);
}

} // namespace ot
