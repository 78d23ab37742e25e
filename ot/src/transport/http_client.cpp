/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/http_client.hpp"
#include <stdexcept>

namespace ot {

HttpClient::HttpClient(std::shared_ptr<MessageHandler> handler)
    : _handler(std::move(handler))
{
    if (!_handler) {
        throw std::invalid_argument("HttpClient: null handler");
    }
}

MessageHandler* HttpClient::primary_handler() const {
    MessageHandler* h = _handler.get();
    while (auto* d = dynamic_cast<DelegatingHandler*>(h)) {
        if (!d->inner()) break;
        h = d->inner().get();
    }
    return h;
}

} // namespace ot
