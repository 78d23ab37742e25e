/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <set>
#include "ot/types.hpp"

namespace ot {

// Client-wide settings shared with the token/authorization layer.
struct ClientOptions {
    // Methods the client may negotiate with a server, in no particular order.
    std::set<ClientAuthenticationMethod> client_authentication_methods;
};

// Enables client_secret_basic, self_signed_tls_client_auth and tls_client_auth.
// Safe to call more than once.
void register_client_authentication_methods(ClientOptions& options);

} // namespace ot
