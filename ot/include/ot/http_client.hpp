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
#include "ot/handlers.hpp"

namespace ot {

// Client-level settings over a (possibly shared) handler chain.
class HttpClient {
public:
    // Framework defaults before any configuration runs.
    static constexpr std::size_t kUnboundedBufferSize = 0x7FFFFFFF;
    static constexpr std::chrono::seconds kFrameworkTimeout{100};

    explicit HttpClient(std::shared_ptr<MessageHandler> handler);

    std::size_t max_response_content_buffer_size() const { return _max_buffer; }
    void set_max_response_content_buffer_size(std::size_t n) { _max_buffer = n; }

    std::chrono::milliseconds timeout() const { return _timeout; }
    void set_timeout(std::chrono::milliseconds t) { _timeout = t; }

    const std::shared_ptr<MessageHandler>& handler() const { return _handler; }

    // Innermost handler of the chain.
    MessageHandler* primary_handler() const;

private:
    std::shared_ptr<MessageHandler> _handler;
    std::size_t _max_buffer = kUnboundedBufferSize;
    std::chrono::milliseconds _timeout = kFrameworkTimeout;
};

} // namespace ot
