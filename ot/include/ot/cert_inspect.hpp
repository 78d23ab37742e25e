/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include "ot/certificate.hpp"

namespace ot {

// id-kp-clientAuth
constexpr const char* kClientAuthEkuOid = "1.3.6.1.5.5.7.3.2";

// Structural attribute checks on a single certificate. No chain building,
// no trust evaluation.

// Raw DER of the subject name equals raw DER of the issuer name.
// Treated as "self-signed" without verifying the signature.
bool is_self_issued(const Certificate& cert);

// A Key Usage extension with digitalSignature set. No extension: false.
bool has_digital_signature_usage(const Certificate& cert);

// An Extended Key Usage extension listing kClientAuthEkuOid.
bool has_client_auth_eku(const Certificate& cert);

// Version 3 or later; extensions are meaningless below that.
bool is_x509_v3(const Certificate& cert);

} // namespace ot
