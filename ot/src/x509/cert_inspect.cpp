/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/cert_inspect.hpp"
#include <openssl/x509v3.h>
#include <openssl/objects.h>
#include <cstring>

namespace {

// Calls fn(ext) for every extension with the given NID until fn returns true.
template <typename Fn>
bool any_extension(X509* x, int nid, Fn&& fn) {
    const int n = X509_get_ext_count(x);
    for (int i = 0; i < n; ++i) {
        X509_EXTENSION* ext = X509_get_ext(x, i);
        if (!ext) continue;
        if (OBJ_obj2nid(X509_EXTENSION_get_object(ext)) != nid) continue;
        if (fn(ext)) return true;
    }
    return false;
}

bool name_der(const X509_NAME* name, const unsigned char*& der, std::size_t& len) {
    return name && X509_NAME_get0_der(name, &der, &len) == 1;
}

} // namespace

namespace ot {

bool is_self_issued(const Certificate& cert) {
    const unsigned char* s = nullptr;
    const unsigned char* i = nullptr;
    std::size_t slen = 0, ilen = 0;
    if (!name_der(X509_get_subject_name(cert.native()), s, slen)) return false;
    if (!name_der(X509_get_issuer_name(cert.native()), i, ilen)) return false;
    return slen == ilen && std::memcmp(s, i, slen) == 0;
}

bool has_digital_signature_usage(const Certificate& cert) {
    return any_extension(cert.native(), NID_key_usage, [](X509_EXTENSION* ext) {
        auto* bits = static_cast<ASN1_BIT_STRING*>(X509V3_EXT_d2i(ext));
        if (!bits) return false;
        // KeyUsage bit 0 is digitalSignature.
        const bool set = ASN1_BIT_STRING_get_bit(bits, 0) != 0;
        ASN1_BIT_STRING_free(bits);
        return set;
    });
}

bool has_client_auth_eku(const Certificate& cert) {
    return any_extension(cert.native(), NID_ext_key_usage, [](X509_EXTENSION* ext) {
        auto* eku = static_cast<EXTENDED_KEY_USAGE*>(X509V3_EXT_d2i(ext));
        if (!eku) return false;
        bool found = false;
        for (int i = 0; i < sk_ASN1_OBJECT_num(eku) && !found; ++i) {
            char oid[80];
            const int n = OBJ_obj2txt(oid, sizeof(oid), sk_ASN1_OBJECT_value(eku, i), 1);
            found = n > 0 && std::strcmp(oid, kClientAuthEkuOid) == 0;
        }
        EXTENDED_KEY_USAGE_free(eku);
        return found;
    });
}

bool is_x509_v3(const Certificate& cert) {
    return cert.version() >= 3;
}

} // namespace ot
