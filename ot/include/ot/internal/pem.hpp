/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include "ot/registration.hpp"

namespace ot::internal {

// Parse a PEM bundle into signing credentials. Certificates keep bundle order
// and get the private key that matches them; unmatched keys follow as bare-key
// credentials. Returns false (and logs) on malformed PEM.
bool load_pem_bundle(const std::string& pem, std::vector<ot::SigningCredential>& out);

} // namespace ot::internal
