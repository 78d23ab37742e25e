/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/configurator.hpp"
#include "ot/errors.hpp"
#include "ot/log.hpp"
#include "ot/name_codec.hpp"

#include <future>
#include <optional>
#include <stdexcept>

namespace {

ot::ClientHandler& require_client_handler(const ot::HandlerBuilder& builder) {
    ot::ClientHandler* handler = ot::as_client_handler(builder);
    if (!handler) {
        const auto& primary = builder.primary_handler();
        throw ot::ConfigurationError(
            std::string("the primary handler of '") + builder.name() +
            "' must be an instance of ot::ClientHandler (found " +
            (primary ? primary->type_name() : "none") + ")");
    }
    return *handler;
}

} // namespace

namespace ot {

void harden_client_handler(ClientHandler& handler) {
    // Encoded responses are decoded by the content layer, not the handler.
    if (handler.supports_automatic_decompression()) {
        handler.set_automatic_decompression(DecompressionMethods::None);
    }
    handler.set_use_cookies(false);
}

TransportConfigurator::TransportConfigurator(ConfigurationContext ctx)
    : _ctx(std::move(ctx))
{
    if (!_ctx.resolver) {
        throw std::invalid_argument("TransportConfigurator: resolver is required");
    }
    if (!_ctx.options) {
        throw std::invalid_argument("TransportConfigurator: options are required");
    }
}

RegistrationPtr TransportConfigurator::resolve(const std::string& id) const {
    // The factory hook is synchronous; only the calling thread blocks here.
    auto resolver = _ctx.resolver;
    auto task = std::async(std::launch::async, [resolver, id]() {
        return resolver->get_registration_by_id(id).get();
    });
    RegistrationPtr registration = task.get();
    if (!registration) {
        throw RegistrationNotFound(id);
    }
    return registration;
}

void TransportConfigurator::configure(const std::string& name, FactoryOptions& options) {
    const auto opt = _ctx.options;

    const PropertyBag properties = decode_name(name, opt->name_prefix);
    auto id = properties.find(kRegistrationIdProperty);
    if (id == properties.end() || id->second.empty()) {
        return;
    }

    const RegistrationPtr registration = resolve(id->second);
    const bool attach_tls = property_flag(properties, kAttachTlsClientCertificateProperty);
    const bool attach_self_signed = property_flag(properties, kAttachSelfSignedTlsClientCertificateProperty);

    log_line("[CONFIG] configuring transport for registration " + registration->registration_id +
             (attach_tls ? " (tls_client_auth)" : attach_self_signed ? " (self_signed_tls_client_auth)" : ""));

    // Runs ahead of the user actions, which may relax it.
    options.client_actions.push_back([](HttpClient& client) {
        client.set_max_response_content_buffer_size(kMaxResponseContentBufferSize);
        client.set_timeout(kTimeout);
    });

    for (const auto& action : opt->client_actions) {
        options.client_actions.push_back([action, registration](HttpClient& client) {
            action(*registration, client);
        });
    }

    options.handler_builder_actions.push_back(
        [opt, registration, attach_tls, attach_self_signed](HandlerBuilder& builder) {
            if (opt->http_error_policy) {
                builder.additional_handlers().push_back(
                    std::make_shared<PolicyHandler>(opt->http_error_policy));
            } else if (opt->resilience_pipeline) {
                builder.additional_handlers().push_back(
                    std::make_shared<ResilienceHandler>(opt->resilience_pipeline));
            }

            ClientHandler& handler = require_client_handler(builder);
            handler.set_client_certificate_options(ClientCertificateOption::Manual);

            if (!attach_tls && !attach_self_signed) return;

            // Selected again on every build, never cached.
            std::optional<Certificate> cert = attach_tls
                ? opt->tls_client_auth_selector(*registration)
                : opt->self_signed_tls_client_auth_selector(*registration);
            if (cert) {
                log_line("[SELECT] attaching client certificate " + cert->subject() +
                         " sha256=" + cert->sha256_fingerprint());
                handler.add_client_certificate(std::move(*cert));
            } else {
                log_line("[SELECT] no eligible client certificate for registration " +
                         registration->registration_id);
            }
        });

    for (const auto& action : opt->handler_actions) {
        options.handler_builder_actions.push_back([action, registration](HandlerBuilder& builder) {
            action(*registration, require_client_handler(builder));
        });
    }
}

void TransportConfigurator::post_configure(const std::string& name, FactoryOptions& options) {
    if (!is_managed_name(name, _ctx.options->name_prefix)) {
        return;
    }

    // Must run before any other action inspects the primary handler.
    options.handler_builder_actions.insert(options.handler_builder_actions.begin(),
        [](HandlerBuilder& builder) {
            if (!as_client_handler(builder)) {
                builder.set_primary_handler(std::make_shared<ClientHandler>());
            }
        });

    options.handler_builder_actions.push_back([](HandlerBuilder& builder) {
        harden_client_handler(require_client_handler(builder));
    });
}

} // namespace ot
