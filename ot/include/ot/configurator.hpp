/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include "ot/registration.hpp"
#include "ot/transport_factory.hpp"
#include "ot/transport_options.hpp"

namespace ot {

// Everything the configurator needs, passed explicitly.
struct ConfigurationContext {
    std::shared_ptr<RegistrationResolver> resolver;
    std::shared_ptr<const TransportOptions> options;
};

// Amends the factory options of managed transports (names carrying the
// options' prefix) for the registration named in the transport name.
class TransportConfigurator : public FactoryConfigurator {
public:
    static constexpr std::size_t kMaxResponseContentBufferSize = 10 * 1024 * 1024;
    static constexpr std::chrono::seconds kTimeout{60};

    // Throws std::invalid_argument when the resolver or options are missing.
    explicit TransportConfigurator(ConfigurationContext ctx);

    // Resolves the registration (blocking the calling thread only) and
    // appends defaults, user client actions, the policy handler, client
    // certificate attachment and user handler actions.
    // Throws ot::RegistrationNotFound for an unknown registration.
    void configure(const std::string& name, FactoryOptions& options) override;

    // Forces a ClientHandler as primary handler and disables automatic
    // decompression and cookies.
    void post_configure(const std::string& name, FactoryOptions& options) override;

private:
    ConfigurationContext _ctx;

    RegistrationPtr resolve(const std::string& id) const;
};

// Hardening applied by post_configure(). Idempotent.
void harden_client_handler(ClientHandler& handler);

} // namespace ot
