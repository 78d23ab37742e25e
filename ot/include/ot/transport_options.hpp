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
#include <memory>
#include <string>
#include <vector>
#include "ot/cert_selector.hpp"
#include "ot/handlers.hpp"
#include "ot/http_client.hpp"
#include "ot/name_codec.hpp"
#include "ot/registration.hpp"

namespace ot {

using ClientAction  = std::function<void(const ClientRegistration&, HttpClient&)>;
using HandlerAction = std::function<void(const ClientRegistration&, ClientHandler&)>;

// Immutable snapshot consumed by TransportConfigurator. Produced by
// TransportOptionsBuilder with both selectors always set.
struct TransportOptions {
    std::string name_prefix = kDefaultNamePrefix;

    // Run in order, after the transport defaults.
    std::vector<ClientAction>  client_actions;
    std::vector<HandlerAction> handler_actions;

    // At most one is attached; the error policy wins when both are set.
    std::shared_ptr<const HttpErrorPolicy>    http_error_policy;
    std::shared_ptr<const ResiliencePipeline> resilience_pipeline;

    CertificateSelector tls_client_auth_selector;
    CertificateSelector self_signed_tls_client_auth_selector;
};

class TransportOptionsBuilder {
public:
    TransportOptionsBuilder& set_name_prefix(std::string prefix);
    TransportOptionsBuilder& add_client_action(ClientAction action);
    TransportOptionsBuilder& add_handler_action(HandlerAction action);
    TransportOptionsBuilder& set_http_error_policy(std::shared_ptr<const HttpErrorPolicy> policy);
    TransportOptionsBuilder& set_resilience_pipeline(std::shared_ptr<const ResiliencePipeline> pipeline);
    TransportOptionsBuilder& set_tls_client_auth_selector(CertificateSelector selector);
    TransportOptionsBuilder& set_self_signed_tls_client_auth_selector(CertificateSelector selector);

    // Missing selectors fall back to the default certificate selection.
    // Throws std::invalid_argument for an empty prefix or an empty action.
    std::shared_ptr<const TransportOptions> build() const;

private:
    TransportOptions _opt;
};

} // namespace ot
