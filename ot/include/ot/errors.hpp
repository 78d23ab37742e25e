/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace ot {

// Host environment or options misconfiguration detected while building a transport.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Raised through the resolver's future when no registration matches the identifier.
class RegistrationNotFound : public std::runtime_error {
public:
    explicit RegistrationNotFound(const std::string& registration_id)
        : std::runtime_error("client registration not found: " + registration_id),
          _id(registration_id) {}

    const std::string& registration_id() const { return _id; }

private:
    std::string _id;
};

// The registration backend could not answer or returned a corrupt record.
// Unlike RegistrationNotFound, a later lookup may succeed.
class RegistrationStoreError : public std::runtime_error {
public:
    explicit RegistrationStoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ot
