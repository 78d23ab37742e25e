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
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <hiredis/hiredis.h>

#include "ot/registration.hpp"

namespace ot {

/**
 * Registration resolver backed by a registration file or by Redis.
 *
 * File format, one credential source per line ('#' starts a comment):
 *
 *     <registration_id> <pem_bundle_path> [issuer [client_id]]
 *
 * Repeated identifiers append credentials in file order.
 *
 * Redis: one hash per registration at <key_prefix><registration_id> with the
 * fields "bundle" (PEM, required), "issuer" and "client_id". Parsed
 * registrations are cached for cache_ttl_sec; misses are not cached.
 *
 * Lookups fail with ot::RegistrationNotFound when the registration does not
 * exist and with ot::RegistrationStoreError when the backend cannot tell.
 */
class RegistrationStore : public RegistrationResolver {
public:
    RegistrationStore();
    ~RegistrationStore() override;

    RegistrationStore(const RegistrationStore&) = delete;
    RegistrationStore& operator=(const RegistrationStore&) = delete;

    bool init_file(const std::string& path);

    struct RedisOptions {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "ot:reg:";
        int         pool_size  = 4;           // open connections at most
        int         timeout_ms = 200;         // connect and command timeout
        int         cache_ttl_sec = 60;
    };
    // Switches to the Redis backend. Returns false when the server cannot be
    // reached right now; lookups keep trying to connect.
    bool init_redis(const RedisOptions& opt);

    // nullptr when the registration does not exist.
    // Throws ot::RegistrationStoreError on backend failures.
    RegistrationPtr lookup(const std::string& registration_id);

    std::future<RegistrationPtr> get_registration_by_id(const std::string& id) override;

private:
    enum class Backend { None, File, Redis };
    Backend _backend = Backend::None;

    std::mutex _file_mtx;
    std::unordered_map<std::string, RegistrationPtr> _file_map;

    struct ContextFree {
        void operator()(::redisContext* c) const { redisFree(c); }
    };
    using Connection = std::unique_ptr<::redisContext, ContextFree>;

    // A pooled connection held for one command. Broken connections are
    // closed instead of going back to the pool.
    class Lease {
    public:
        // Throws ot::RegistrationStoreError when no connection can be opened.
        explicit Lease(RegistrationStore& store);
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ::redisContext* get() const { return _conn.get(); }

    private:
        RegistrationStore& _store;
        Connection _conn;
    };

    RedisOptions _redis;
    std::mutex _pool_mtx;
    std::condition_variable _pool_cv;
    std::vector<Connection> _idle;
    int _open = 0;                              // idle + leased

    struct Cached {
        RegistrationPtr registration;
        std::chrono::steady_clock::time_point expires;
    };
    std::mutex _cache_mtx;
    std::unordered_map<std::string, Cached> _cache;

    Connection open_connection() const;
    RegistrationPtr redis_fetch(const std::string& registration_id);
};

namespace internal {

// Registration from the fields of its Redis hash. Throws
// ot::RegistrationStoreError when "bundle" is missing or not a usable PEM bundle.
RegistrationPtr registration_from_fields(const std::string& registration_id,
                                         const std::map<std::string, std::string>& fields);

} // namespace internal

} // namespace ot
