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
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "ot/handlers.hpp"
#include "ot/http_client.hpp"
#include "ot/types.hpp"

namespace ot {

// Per-name recipe for building a transport.
struct FactoryOptions {
    // Run on every new HttpClient, in order.
    std::vector<std::function<void(HttpClient&)>> client_actions;
    // Run on every handler chain build, in order.
    std::vector<std::function<void(HandlerBuilder&)>> handler_builder_actions;
};

// Hook invoked once per name, before the first build. All configure() calls
// run before any post_configure() call.
class FactoryConfigurator {
public:
    virtual ~FactoryConfigurator() = default;
    virtual void configure(const std::string& name, FactoryOptions& options) = 0;
    virtual void post_configure(const std::string& name, FactoryOptions& options) = 0;
};

// Pooled transport construction keyed by name. Handler chains are shared by
// all clients of a name and rebuilt once their lifetime elapses; at most one
// build per name runs at a time.
class TransportFactory {
public:
    explicit TransportFactory(std::chrono::milliseconds handler_lifetime = std::chrono::minutes(2));

    void add_configurator(std::shared_ptr<FactoryConfigurator> configurator);

    // New client over the cached (or freshly built) chain for `name`.
    // Exceptions thrown by configurators or actions propagate; the name is
    // then retried from scratch on the next call.
    std::shared_ptr<HttpClient> create_client(const std::string& name);

    // Drops the cached chain and options of a name. Waits for a build of
    // that name in progress to finish.
    void invalidate(const std::string& name);

private:
    using clock = std::chrono::steady_clock;

    struct Entry {
        std::mutex build_mtx;
        std::shared_ptr<const FactoryOptions> options;
        std::shared_ptr<MessageHandler> handler;
        clock::time_point expires{};
    };

    std::chrono::milliseconds _lifetime;
    std::mutex _mtx;
    std::vector<std::shared_ptr<FactoryConfigurator>> _configurators;
    std::unordered_map<std::string, std::shared_ptr<Entry>> _entries;

    std::shared_ptr<const FactoryOptions> build_options(const std::string& name);
    std::shared_ptr<MessageHandler> build_handler(const std::string& name, const FactoryOptions& options);
};

// Managed transport name for a registration and the negotiated client
// authentication method. Throws std::invalid_argument for an empty identifier.
std::string transport_name(const std::string& prefix,
                           const std::string& registration_id,
                           ClientAuthenticationMethod method);

} // namespace ot
