/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/transport_factory.hpp"
#include "ot/name_codec.hpp"
#include "ot/log.hpp"
#include <stdexcept>

namespace ot {

TransportFactory::TransportFactory(std::chrono::milliseconds handler_lifetime)
    : _lifetime(handler_lifetime) {}

void TransportFactory::add_configurator(std::shared_ptr<FactoryConfigurator> configurator) {
    if (!configurator) {
        throw std::invalid_argument("TransportFactory: null configurator");
    }
    std::lock_guard<std::mutex> lk(_mtx);
    _configurators.push_back(std::move(configurator));
}

std::shared_ptr<HttpClient> TransportFactory::create_client(const std::string& name) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        auto& slot = _entries[name];
        if (!slot) slot = std::make_shared<Entry>();
        entry = slot;
    }

    std::shared_ptr<const FactoryOptions> options;
    std::shared_ptr<MessageHandler> handler;
    {
        // One build per name at a time; other names proceed in parallel.
        std::lock_guard<std::mutex> lk(entry->build_mtx);
        if (!entry->options) {
            entry->options = build_options(name);
        }
        const auto now = clock::now();
        if (!entry->handler || now >= entry->expires) {
            entry->handler = build_handler(name, *entry->options);
            entry->expires = now + _lifetime;
        }
        options = entry->options;
        handler = entry->handler;
    }

    auto client = std::make_shared<HttpClient>(handler);
    for (const auto& action : options->client_actions) {
        action(*client);
    }
    return client;
}

void TransportFactory::invalidate(const std::string& name) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        auto it = _entries.find(name);
        if (it == _entries.end()) return;
        entry = it->second;
    }
    // The entry stays in place so a build in progress keeps excluding others.
    std::lock_guard<std::mutex> lk(entry->build_mtx);
    entry->options.reset();
    entry->handler.reset();
}

std::shared_ptr<const FactoryOptions> TransportFactory::build_options(const std::string& name) {
    std::vector<std::shared_ptr<FactoryConfigurator>> hooks;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        hooks = _configurators;
    }
    auto options = std::make_shared<FactoryOptions>();
    for (const auto& h : hooks) h->configure(name, *options);
    for (const auto& h : hooks) h->post_configure(name, *options);
    return options;
}

std::shared_ptr<MessageHandler> TransportFactory::build_handler(const std::string& name,
                                                                const FactoryOptions& options)
{
    HandlerBuilder builder(name);
    builder.set_primary_handler(std::make_shared<SocketsHandler>());
    for (const auto& action : options.handler_builder_actions) {
        action(builder);
    }
    auto handler = builder.build();
    log_line("[FACTORY] built handler chain, primary=" +
             std::string(builder.primary_handler()->type_name()) +
             " additional=" + std::to_string(builder.additional_handlers().size()));
    return handler;
}

std::string transport_name(const std::string& prefix,
                           const std::string& registration_id,
                           ClientAuthenticationMethod method)
{
    if (registration_id.empty()) {
        throw std::invalid_argument("transport_name: registration identifier must not be empty");
    }
    PropertyBag props;
    props[kRegistrationIdProperty] = registration_id;
    if (method == ClientAuthenticationMethod::TlsClientAuth) {
        props[kAttachTlsClientCertificateProperty] = "true";
    } else if (method == ClientAuthenticationMethod::SelfSignedTlsClientAuth) {
        props[kAttachSelfSignedTlsClientCertificateProperty] = "true";
    }
    return encode_name(prefix, props);
}

} // namespace ot
