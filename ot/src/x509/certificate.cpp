/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/certificate.hpp"
#include "ot/internal/utils.hpp"
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <stdexcept>

namespace {

std::string name_oneline(const X509_NAME* name) {
    if (!name) return {};
    char buf[512];
    if (!X509_NAME_oneline(name, buf, sizeof(buf))) return {};
    return std::string(buf);
}

} // namespace

namespace ot {

Certificate::Certificate(X509* cert, EVP_PKEY* key)
    : _cert(cert, [](X509* x){ if (x) X509_free(x); }),
      _key(key, [](EVP_PKEY* k){ if (k) EVP_PKEY_free(k); })
{
    if (!cert) {
        throw std::invalid_argument("Certificate: null X509");
    }
}

std::optional<Certificate> Certificate::from_pem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) return std::nullopt;
    X509* x = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!x) return std::nullopt;
    return Certificate(x);
}

Certificate Certificate::with_private_key(EVP_PKEY* key) const {
    Certificate c(*this);
    c._key.reset(key, [](EVP_PKEY* k){ if (k) EVP_PKEY_free(k); });
    return c;
}

int Certificate::version() const {
    // X509_get_version() is zero-based: 2 means v3.
    return static_cast<int>(X509_get_version(_cert.get())) + 1;
}

std::string Certificate::subject() const {
    return name_oneline(X509_get_subject_name(_cert.get()));
}

std::string Certificate::issuer() const {
    return name_oneline(X509_get_issuer_name(_cert.get()));
}

std::string Certificate::sha256_fingerprint() const {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(_cert.get(), EVP_sha256(), md, &len) != 1) return {};
    return internal::bytes_to_hex(md, len);
}

std::string Certificate::to_pem() const {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return {};
    std::string out;
    if (PEM_write_bio_X509(bio, _cert.get()) == 1) {
        char* data = nullptr;
        long n = BIO_get_mem_data(bio, &data);
        if (n > 0 && data) out.assign(data, static_cast<std::size_t>(n));
    }
    BIO_free(bio);
    return out;
}

bool Certificate::operator==(const Certificate& other) const {
    if (_cert == other._cert) return true;
    return X509_cmp(_cert.get(), other._cert.get()) == 0;
}

} // namespace ot
