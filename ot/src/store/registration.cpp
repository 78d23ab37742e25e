/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/registration.hpp"
#include "ot/errors.hpp"
#include <stdexcept>

namespace ot {

void InMemoryRegistrationResolver::add(RegistrationPtr registration) {
    if (!registration || registration->registration_id.empty()) {
        throw std::invalid_argument("registration must have an identifier");
    }
    std::lock_guard<std::mutex> lk(_mtx);
    _map[registration->registration_id] = std::move(registration);
}

bool InMemoryRegistrationResolver::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(_mtx);
    return _map.erase(id) > 0;
}

std::future<RegistrationPtr> InMemoryRegistrationResolver::get_registration_by_id(const std::string& id) {
    std::promise<RegistrationPtr> p;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        auto it = _map.find(id);
        if (it != _map.end()) {
            p.set_value(it->second);
            return p.get_future();
        }
    }
    p.set_exception(std::make_exception_ptr(RegistrationNotFound(id)));
    return p.get_future();
}

} // namespace ot
