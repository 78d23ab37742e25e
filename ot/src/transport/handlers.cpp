/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/handlers.hpp"
#include "ot/errors.hpp"
#include "ot/internal/tls_cli_ctx.hpp"

namespace ot {

ClientHandler::ClientHandler(bool supports_automatic_decompression)
    : _supports_decompression(supports_automatic_decompression) {}

ClientHandler::~ClientHandler() = default;

void ClientHandler::set_automatic_decompression(DecompressionMethods m) {
    if (!_supports_decompression) return;
    _decompression = m;
}

std::unique_ptr<internal::TlsClientContext> ClientHandler::create_tls_context() const {
    auto ctx = std::make_unique<internal::TlsClientContext>(*this);
    if (!ctx->ok()) return nullptr;
    return ctx;
}

HandlerBuilder::HandlerBuilder(std::string name) : _name(std::move(name)) {}

std::shared_ptr<MessageHandler> HandlerBuilder::build() {
    if (!_primary) {
        throw ConfigurationError("handler chain '" + _name + "' has no primary handler");
    }
    std::shared_ptr<MessageHandler> next = _primary;
    for (auto it = _additional.rbegin(); it != _additional.rend(); ++it) {
        if (!*it) continue;
        (*it)->set_inner(next);
        next = *it;
    }
    return next;
}

ClientHandler* as_client_handler(const HandlerBuilder& builder) {
    return dynamic_cast<ClientHandler*>(builder.primary_handler().get());
}

} // namespace ot
