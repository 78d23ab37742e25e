/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

// apps/ot_transport_cli.cpp
// Builds the transport for one registration and prints what it ended up with.

#include "ot/client_options.hpp"
#include "ot/configurator.hpp"
#include "ot/errors.hpp"
#include "ot/internal/tls_cli_ctx.hpp"
#include "ot/log.hpp"
#include "ot/registration_store.hpp"
#include "ot/transport_factory.hpp"
#include "ot/transport_options.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <string>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " (--registrations FILE | --redis HOST:PORT [--redis_db N] [--redis_password P])\n"
      "      --registration ID [--auth none|tls|self_signed] [--prefix P] [--log FILE]\n"
      "      [--tls_ca FILE] [--insecure 0|1]\n"
      "\n"
      "  --registrations FILE   registration file: '<id> <pem_bundle> [issuer [client_id]]' per line\n"
      "  --redis HOST:PORT      Redis backend; hash ot:reg:<id> with bundle, issuer, client_id\n"
      "  --auth                 client authentication method (default none)\n"
      "  --tls_ca FILE          CA bundle for server verification (default: system store)\n";
}

static const char* decompression_name(ot::DecompressionMethods m){
    switch (m) {
    case ot::DecompressionMethods::None:    return "none";
    case ot::DecompressionMethods::GZip:    return "gzip";
    case ot::DecompressionMethods::Deflate: return "deflate";
    case ot::DecompressionMethods::Brotli:  return "brotli";
    case ot::DecompressionMethods::All:     return "all";
    default: return "mixed";
    }
}

// Whole-string decimal integer in [min_v, max_v].
static bool parse_int(const std::string& s, int min_v, int max_v, int& out){
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < min_v || v > max_v) return false;
    out = static_cast<int>(v);
    return true;
}

int main(int argc, char** argv){
    std::string file, redis, redis_password, registration, prefix = ot::kDefaultNamePrefix;
    std::string auth = "none", log_file, tls_ca;
    int redis_db = 0;
    int insecure = 0;

    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a=="--registrations" && i+1<argc) file = argv[++i];
        else if(a=="--redis" && i+1<argc) redis = argv[++i];
        else if(a=="--redis_db" && i+1<argc) { if (!parse_int(argv[++i], 0, INT_MAX, redis_db)) { usage(argv[0]); return 2; } }
        else if(a=="--redis_password" && i+1<argc) redis_password = argv[++i];
        else if(a=="--registration" && i+1<argc) registration = argv[++i];
        else if(a=="--auth" && i+1<argc) auth = argv[++i];
        else if(a=="--prefix" && i+1<argc) prefix = argv[++i];
        else if(a=="--log" && i+1<argc) log_file = argv[++i];
        else if(a=="--tls_ca" && i+1<argc) tls_ca = argv[++i];
        else if(a=="--insecure" && i+1<argc) { if (!parse_int(argv[++i], 0, 1, insecure)) { usage(argv[0]); return 2; } }
        else { usage(argv[0]); return 2; }
    }

    if (registration.empty() || file.empty() == redis.empty()) {
        usage(argv[0]);
        return 2;
    }
    const bool verify_peer = (insecure == 0);

    ot::RegistrationStore::RedisOptions ro;
    if (!redis.empty()) {
        const auto colon = redis.rfind(':');
        ro.host = redis.substr(0, colon);
        if (colon != std::string::npos &&
            !parse_int(redis.substr(colon + 1), 1, 65535, ro.port)) {
            usage(argv[0]);
            return 2;
        }
        ro.db = redis_db;
        ro.password = redis_password;
    }

    ot::ClientAuthenticationMethod method;
    if (auth == "none") method = ot::ClientAuthenticationMethod::ClientSecretBasic;
    else if (auth == "tls") method = ot::ClientAuthenticationMethod::TlsClientAuth;
    else if (auth == "self_signed") method = ot::ClientAuthenticationMethod::SelfSignedTlsClientAuth;
    else if (!ot::parse_client_authentication_method(auth, method)) { usage(argv[0]); return 2; }

    ot::ClientOptions client_options;
    ot::register_client_authentication_methods(client_options);
    if (!client_options.client_authentication_methods.count(method)) {
        std::cerr << "authentication method not enabled: " << ot::to_string(method) << "\n";
        return 2;
    }

    ot::set_log_file(log_file);

    auto store = std::make_shared<ot::RegistrationStore>();
    if (!file.empty()) {
        if (!store->init_file(file)) {
            std::cerr << "cannot load registrations from " << file << "\n";
            return 1;
        }
    } else {
        if (!store->init_redis(ro)) {
            std::cerr << "cannot initialize redis backend at " << redis << "\n";
            return 1;
        }
    }

    try {
        auto options = ot::TransportOptionsBuilder()
            .set_name_prefix(prefix)
            .add_handler_action([&](const ot::ClientRegistration&, ot::ClientHandler& h) {
                h.set_verify_peer(verify_peer);
                if (!tls_ca.empty()) h.set_ca_file(tls_ca);
            })
            .build();

        ot::TransportFactory factory;
        factory.add_configurator(std::make_shared<ot::TransportConfigurator>(
            ot::ConfigurationContext{store, options}));

        const std::string name = ot::transport_name(prefix, registration, method);
        auto client = factory.create_client(name);

        const ot::RegistrationPtr reg = store->get_registration_by_id(registration).get();
        std::cout << "registration: " << registration << " (" << ot::to_string(method) << ")\n";
        if (!reg->client_id.empty()) std::cout << "client id:    " << reg->client_id << "\n";
        if (!reg->issuer.empty())    std::cout << "issuer:       " << reg->issuer << "\n";
        std::cout << "timeout:      " << client->timeout().count() << " ms\n";
        std::cout << "buffer cap:   " << client->max_response_content_buffer_size() << " bytes\n";

        std::cout << "chain:       ";
        for (ot::MessageHandler* h = client->handler().get(); h; ) {
            std::cout << " " << h->type_name();
            auto* d = dynamic_cast<ot::DelegatingHandler*>(h);
            h = d ? d->inner().get() : nullptr;
        }
        std::cout << "\n";

        auto* handler = dynamic_cast<ot::ClientHandler*>(client->primary_handler());
        if (!handler) return 0;

        std::cout << "cookies:      " << (handler->use_cookies() ? "on" : "off") << "\n";
        std::cout << "decompress:   " << decompression_name(handler->automatic_decompression()) << "\n";
        std::cout << "certificates: " << handler->client_certificates().size() << "\n";
        for (const auto& cert : handler->client_certificates()) {
            std::cout << "  " << cert.subject() << "\n"
                      << "    issuer " << cert.issuer() << "\n"
                      << "    sha256 " << cert.sha256_fingerprint() << "\n";
        }

        auto tls = handler->create_tls_context();
        std::cout << "tls context:  " << (tls ? "ok" : "failed") << "\n";
        return tls ? 0 : 1;
    } catch (const ot::RegistrationNotFound& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const ot::RegistrationStoreError& e) {
        std::cerr << "registration backend: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
