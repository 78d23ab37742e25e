/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/name_codec.hpp"
#include "ot/internal/utils.hpp"
#include <vector>

namespace {

// Split on a single character, skipping empty fragments.
std::vector<std::string> split_non_empty(const std::string& s, std::size_t from, char sep) {
    std::vector<std::string> out;
    std::size_t start = from;
    while (start <= s.size()) {
        std::size_t end = s.find(sep, start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.emplace_back(s, start, end - start);
        start = end + 1;
    }
    return out;
}

} // namespace

namespace ot {

bool is_managed_name(const std::string& name, const std::string& prefix) {
    return name.size() > prefix.size() &&
           name.compare(0, prefix.size(), prefix) == 0 &&
           name[prefix.size()] == ':';
}

std::string encode_name(const std::string& prefix, const PropertyBag& properties) {
    std::string name = prefix;
    name.push_back(':');
    bool first = true;
    for (const auto& kv : properties) {
        if (!first) name.push_back(kEntrySeparator);
        first = false;
        name += kv.first;
        name.push_back(kPairSeparator);
        name += kv.second;
    }
    return name;
}

PropertyBag decode_name(const std::string& name, const std::string& prefix) {
    PropertyBag bag;
    if (!is_managed_name(name, prefix)) return bag;

    for (const auto& entry : split_non_empty(name, prefix.size() + 1, kEntrySeparator)) {
        auto parts = split_non_empty(entry, 0, kPairSeparator);
        if (parts.size() != 2) continue;   // malformed: dropped
        bag[parts[0]] = std::move(parts[1]);
    }
    return bag;
}

bool property_flag(const PropertyBag& properties, const std::string& key) {
    auto it = properties.find(key);
    if (it == properties.end()) return false;
    bool v = false;
    return internal::parse_bool(it->second, v) && v;
}

} // namespace ot
