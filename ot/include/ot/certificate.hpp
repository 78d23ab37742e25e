/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <openssl/x509.h>
#include <openssl/evp.h>

namespace ot {

// Shared, immutable X.509 certificate with an optional private key.
// Copies share the underlying OpenSSL objects.
class Certificate {
public:
    // Takes ownership of one reference to each object; key may be null.
    explicit Certificate(X509* cert, EVP_PKEY* key = nullptr);

    // First certificate of a PEM text, or nothing.
    static std::optional<Certificate> from_pem(const std::string& pem);

    X509*     native() const { return _cert.get(); }
    EVP_PKEY* private_key() const { return _key.get(); }
    bool      has_private_key() const { return _key != nullptr; }

    // Same certificate with a private key bound to it (one reference taken).
    Certificate with_private_key(EVP_PKEY* key) const;

    // X.509 version number as written on the certificate (1, 2 or 3).
    int version() const;

    std::string subject() const;
    std::string issuer() const;
    std::string sha256_fingerprint() const;
    std::string to_pem() const;

    bool operator==(const Certificate& other) const;
    bool operator!=(const Certificate& other) const { return !(*this == other); }

private:
    std::shared_ptr<X509>     _cert;
    std::shared_ptr<EVP_PKEY> _key;
};

} // namespace ot
