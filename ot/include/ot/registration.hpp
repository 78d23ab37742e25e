/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <openssl/evp.h>
#include "ot/certificate.hpp"

namespace ot {

// One signing key of a client registration. Either an X.509 certificate
// (with its private key when available) or a bare key.
struct SigningCredential {
    std::string key_id;
    std::string algorithm;                 // e.g. "RS256", "ES256"
    std::optional<Certificate> certificate;
    std::shared_ptr<EVP_PKEY> key;         // bare keys only
};

// Client registration as seen by the transport layer.
struct ClientRegistration {
    std::string registration_id;
    std::string issuer;
    std::string client_id;
    std::vector<SigningCredential> signing_credentials;   // order matters
};

using RegistrationPtr = std::shared_ptr<const ClientRegistration>;

// Registration lookup. May perform I/O; the future fails with
// ot::RegistrationNotFound when no registration has the identifier.
class RegistrationResolver {
public:
    virtual ~RegistrationResolver() = default;
    virtual std::future<RegistrationPtr> get_registration_by_id(const std::string& id) = 0;
};

// Registrations held in memory, keyed by identifier. Thread-safe.
class InMemoryRegistrationResolver : public RegistrationResolver {
public:
    // Replaces any registration with the same identifier.
    void add(RegistrationPtr registration);
    bool remove(const std::string& id);

    std::future<RegistrationPtr> get_registration_by_id(const std::string& id) override;

private:
    std::mutex _mtx;
    std::unordered_map<std::string, RegistrationPtr> _map;
};

} // namespace ot
