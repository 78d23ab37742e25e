/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/internal/pem.hpp"
#include "ot/log.hpp"
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <cstring>
#include <iterator>

namespace {

std::string key_algorithm(EVP_PKEY* key) {
    switch (EVP_PKEY_get_base_id(key)) {
    case EVP_PKEY_RSA:     return "RS256";
    case EVP_PKEY_EC:      return "ES256";
    case EVP_PKEY_ED25519: return "EdDSA";
    default: return {};
    }
}

bool ends_with(const char* s, const char* suffix) {
    const std::size_t n = std::strlen(s), m = std::strlen(suffix);
    return n >= m && std::strcmp(s + n - m, suffix) == 0;
}

void free_all(std::vector<X509*>& certs, std::vector<EVP_PKEY*>& keys) {
    for (X509* x : certs) X509_free(x);
    for (EVP_PKEY* k : keys) EVP_PKEY_free(k);
    certs.clear();
    keys.clear();
}

} // namespace

namespace ot::internal {

bool load_pem_bundle(const std::string& pem, std::vector<ot::SigningCredential>& out) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) return false;

    std::vector<X509*> certs;
    std::vector<EVP_PKEY*> keys;
    bool ok = true;

    ERR_clear_error();
    for (;;) {
        char* name = nullptr;
        char* header = nullptr;
        unsigned char* data = nullptr;
        long len = 0;
        if (PEM_read_bio(bio, &name, &header, &data, &len) != 1) {
            // End of input shows up as "no start line".
            const unsigned long e = ERR_peek_last_error();
            if (ERR_GET_REASON(e) == PEM_R_NO_START_LINE) {
                ERR_clear_error();
            } else {
                ot::log_openssl_errors("[STORE]", "PEM_read_bio");
                ok = false;
            }
            break;
        }

        const unsigned char* p = data;
        if (std::strcmp(name, PEM_STRING_X509) == 0) {
            X509* x = d2i_X509(nullptr, &p, len);
            if (x) certs.push_back(x);
            else { ot::log_openssl_errors("[STORE]", "d2i_X509"); ok = false; }
        } else if (ends_with(name, "PRIVATE KEY") && std::strstr(name, "ENCRYPTED") == nullptr) {
            EVP_PKEY* k = d2i_AutoPrivateKey(nullptr, &p, len);
            if (k) keys.push_back(k);
            else { ot::log_openssl_errors("[STORE]", "d2i_AutoPrivateKey"); ok = false; }
        }
        // Other block types (CRLs, parameters, encrypted keys) are skipped.

        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
        if (!ok) break;
    }
    BIO_free(bio);

    if (!ok || (certs.empty() && keys.empty())) {
        if (ok) ot::log_line("[STORE] PEM bundle holds no certificate or private key");
        free_all(certs, keys);
        return false;
    }

    std::vector<ot::SigningCredential> creds;
    for (X509* x : certs) {
        EVP_PKEY* matched = nullptr;
        for (auto& k : keys) {
            if (k && X509_check_private_key(x, k) == 1) {
                matched = k;
                k = nullptr;   // ownership moves to the certificate
                break;
            }
        }
        ERR_clear_error();   // X509_check_private_key queues errors on mismatch

        ot::SigningCredential c;
        c.certificate.emplace(x, matched);
        if (matched) c.algorithm = key_algorithm(matched);
        c.key_id = c.certificate->sha256_fingerprint();
        creds.push_back(std::move(c));
    }
    for (EVP_PKEY* k : keys) {
        if (!k) continue;
        ot::SigningCredential c;
        c.algorithm = key_algorithm(k);
        c.key.reset(k, [](EVP_PKEY* key){ EVP_PKEY_free(key); });
        creds.push_back(std::move(c));
    }

    out.insert(out.end(), std::make_move_iterator(creds.begin()), std::make_move_iterator(creds.end()));
    return true;
}

} // namespace ot::internal
