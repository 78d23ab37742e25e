/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/transport_options.hpp"
#include "ot/log.hpp"
#include <stdexcept>

namespace ot {

TransportOptionsBuilder& TransportOptionsBuilder::set_name_prefix(std::string prefix) {
    _opt.name_prefix = std::move(prefix);
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::add_client_action(ClientAction action) {
    _opt.client_actions.push_back(std::move(action));
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::add_handler_action(HandlerAction action) {
    _opt.handler_actions.push_back(std::move(action));
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::set_http_error_policy(std::shared_ptr<const HttpErrorPolicy> policy) {
    _opt.http_error_policy = std::move(policy);
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::set_resilience_pipeline(std::shared_ptr<const ResiliencePipeline> pipeline) {
    _opt.resilience_pipeline = std::move(pipeline);
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::set_tls_client_auth_selector(CertificateSelector selector) {
    _opt.tls_client_auth_selector = std::move(selector);
    return *this;
}

TransportOptionsBuilder& TransportOptionsBuilder::set_self_signed_tls_client_auth_selector(CertificateSelector selector) {
    _opt.self_signed_tls_client_auth_selector = std::move(selector);
    return *this;
}

std::shared_ptr<const TransportOptions> TransportOptionsBuilder::build() const {
    if (_opt.name_prefix.empty()) {
        throw std::invalid_argument("TransportOptions: name_prefix must not be empty");
    }
    for (const auto& a : _opt.client_actions) {
        if (!a) throw std::invalid_argument("TransportOptions: empty client action");
    }
    for (const auto& a : _opt.handler_actions) {
        if (!a) throw std::invalid_argument("TransportOptions: empty handler action");
    }

    auto opt = std::make_shared<TransportOptions>(_opt);
    if (!opt->tls_client_auth_selector) {
        opt->tls_client_auth_selector = &select_tls_client_certificate;
    }
    if (!opt->self_signed_tls_client_auth_selector) {
        opt->self_signed_tls_client_auth_selector = &select_self_signed_tls_client_certificate;
    }
    if (opt->http_error_policy && opt->resilience_pipeline) {
        log_line("[CONFIG] both an HTTP error policy and a resilience pipeline are set; "
                 "only the error policy '" + opt->http_error_policy->name() + "' will be attached");
    }
    return opt;
}

} // namespace ot
