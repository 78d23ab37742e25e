/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <optional>
#include "ot/certificate.hpp"
#include "ot/registration.hpp"

namespace ot {

// Picks the certificate presented for one TLS client authentication method.
using CertificateSelector = std::function<std::optional<Certificate>(const ClientRegistration&)>;

// Default selectors: first signing credential, in registration order, whose
// certificate is v3, carries digitalSignature key usage and the clientAuth EKU,
// and is self-issued (self_signed_tls_client_auth) or not (tls_client_auth).
std::optional<Certificate> select_self_signed_tls_client_certificate(const ClientRegistration& registration);
std::optional<Certificate> select_tls_client_certificate(const ClientRegistration& registration);

} // namespace ot
