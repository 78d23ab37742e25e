/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/cert_selector.hpp"
#include "ot/cert_inspect.hpp"

namespace {

std::optional<ot::Certificate> select_first(const ot::ClientRegistration& registration,
                                            bool self_issued)
{
    for (const auto& credential : registration.signing_credentials) {
        if (!credential.certificate) continue;   // not an X.509 key
        const ot::Certificate& cert = *credential.certificate;
        if (ot::is_x509_v3(cert) &&
            ot::is_self_issued(cert) == self_issued &&
            ot::has_digital_signature_usage(cert) &&
            ot::has_client_auth_eku(cert)) {
            return cert;
        }
    }
    return std::nullopt;
}

} // namespace

namespace ot {

std::optional<Certificate> select_self_signed_tls_client_certificate(const ClientRegistration& registration) {
    return select_first(registration, true);
}

std::optional<Certificate> select_tls_client_certificate(const ClientRegistration& registration) {
    return select_first(registration, false);
}

} // namespace ot
