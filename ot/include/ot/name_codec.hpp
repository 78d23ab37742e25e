/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <map>
#include <string>

namespace ot {

// Transport names carry per-instance properties because the transport cache
// only knows a flat name string:
//
//   "<prefix>:" key RS value US key RS value ...
//
// RS (U+001E) separates a key from its value, US (U+001F) separates entries.
using PropertyBag = std::map<std::string, std::string>;

constexpr char kEntrySeparator = '\x1f';
constexpr char kPairSeparator  = '\x1e';

constexpr const char* kDefaultNamePrefix = "OidcTransport.Client";

// Recognized property keys.
constexpr const char* kRegistrationIdProperty = "RegistrationId";
constexpr const char* kAttachTlsClientCertificateProperty = "AttachTlsClientCertificate";
constexpr const char* kAttachSelfSignedTlsClientCertificateProperty = "AttachSelfSignedTlsClientCertificate";

// True when the name starts with "<prefix>:".
bool is_managed_name(const std::string& name, const std::string& prefix);

// No validation: callers must not pass empty keys/values or embedded separators.
std::string encode_name(const std::string& prefix, const PropertyBag& properties);

// Empty bag for names not starting with "<prefix>:". Entries that do not split
// into exactly two non-empty parts are dropped; duplicate keys keep the last value.
PropertyBag decode_name(const std::string& name, const std::string& prefix);

// Boolean property lookup; missing or unparsable values read as false.
bool property_flag(const PropertyBag& properties, const std::string& key);

} // namespace ot
