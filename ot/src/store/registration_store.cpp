/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include "ot/registration_store.hpp"
#include "ot/errors.hpp"
#include "ot/log.hpp"
#include "ot/internal/pem.hpp"
#include "ot/internal/utils.hpp"

#include <fstream>
#include <sstream>
#include <sys/time.h>

namespace {

// Relative bundle paths are taken relative to the registration file.
std::string resolve_relative(const std::string& base_file, const std::string& path) {
    if (path.empty() || path[0] == '/') return path;
    const auto slash = base_file.rfind('/');
    if (slash == std::string::npos) return path;
    return base_file.substr(0, slash + 1) + path;
}

struct ReplyFree {
    void operator()(redisReply* r) const { freeReplyObject(r); }
};
using Reply = std::unique_ptr<redisReply, ReplyFree>;

// Binary-safe command; null on I/O failure (the context's err is then set).
Reply command(::redisContext* c, const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    for (const auto& a : args) {
        argv.push_back(a.data());
        lens.push_back(a.size());
    }
    return Reply(static_cast<redisReply*>(
        redisCommandArgv(c, static_cast<int>(argv.size()), argv.data(), lens.data())));
}

std::string reply_text(const redisReply* r) {
    return (r && r->str) ? std::string(r->str, r->len) : std::string();
}

// Connection setup command (AUTH, SELECT). Logs and returns false on failure.
bool setup(::redisContext* c, const std::vector<std::string>& args) {
    Reply r = command(c, args);
    if (!r) {
        ot::log_line("[STORE][redis] " + args.front() + " failed: " + c->errstr);
        return false;
    }
    if (r->type == REDIS_REPLY_ERROR) {
        ot::log_line("[STORE][redis] " + args.front() + " rejected: " + reply_text(r.get()));
        return false;
    }
    return true;
}

} // namespace

namespace ot {

namespace internal {

RegistrationPtr registration_from_fields(const std::string& registration_id,
                                         const std::map<std::string, std::string>& fields)
{
    auto bundle = fields.find("bundle");
    if (bundle == fields.end() || bundle->second.empty()) {
        throw RegistrationStoreError("registration " + registration_id + " has no PEM bundle");
    }
    auto reg = std::make_shared<ClientRegistration>();
    reg->registration_id = registration_id;
    auto issuer = fields.find("issuer");
    if (issuer != fields.end()) reg->issuer = issuer->second;
    auto client_id = fields.find("client_id");
    if (client_id != fields.end()) reg->client_id = client_id->second;

    if (!load_pem_bundle(bundle->second, reg->signing_credentials)) {
        throw RegistrationStoreError("registration " + registration_id + " has a malformed PEM bundle");
    }
    return reg;
}

} // namespace internal

RegistrationStore::RegistrationStore() = default;
RegistrationStore::~RegistrationStore() = default;

/* ---------------- File backend ---------------- */

bool RegistrationStore::init_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        log_line(std::string("[STORE] failed to open file: ")+path);
        return false;
    }
    std::unordered_map<std::string, std::shared_ptr<ClientRegistration>> tmp;
    size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        internal::trim_inplace(line);
        if (line.empty() || line[0]=='#') continue;

        std::istringstream iss(line);
        std::string id, bundle, issuer, client_id;
        if (!(iss >> id >> bundle)) {
            log_line("[STORE] bad line "+std::to_string(line_no));
            return false;
        }
        iss >> issuer >> client_id;

        std::string pem;
        const std::string bundle_path = resolve_relative(path, bundle);
        if (!internal::read_file(bundle_path, pem)) {
            log_line("[STORE] cannot read PEM bundle at line "+std::to_string(line_no)+": "+bundle_path);
            return false;
        }

        auto& reg = tmp[id];
        if (!reg) {
            reg = std::make_shared<ClientRegistration>();
            reg->registration_id = id;
        }
        if (!issuer.empty()) reg->issuer = issuer;
        if (!client_id.empty()) reg->client_id = client_id;
        if (!internal::load_pem_bundle(pem, reg->signing_credentials)) {
            log_line("[STORE] bad PEM bundle at line "+std::to_string(line_no));
            return false;
        }
    }

    std::unordered_map<std::string, RegistrationPtr> frozen;
    for (auto& kv : tmp) frozen.emplace(kv.first, std::move(kv.second));
    {
        std::lock_guard<std::mutex> lk(_file_mtx);
        _file_map.swap(frozen);
        _backend = Backend::File;
        log_line("[STORE] file backend initialized: "+std::to_string(_file_map.size())+" registrations");
    }
    return true;
}

/* ---------------- Redis backend ---------------- */

bool RegistrationStore::init_redis(const RedisOptions& opt) {
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _redis = opt;
        if (_redis.pool_size <= 0) _redis.pool_size = 1;
        _idle.clear();
        _open = 0;
    }
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache.clear();
    }
    _backend = Backend::Redis;
    log_line("[STORE] redis backend " + _redis.host + ":" + std::to_string(_redis.port) +
             " db=" + std::to_string(_redis.db) +
             " prefix=" + _redis.key_prefix +
             " pool=" + std::to_string(_redis.pool_size) +
             " cache_ttl=" + std::to_string(_redis.cache_ttl_sec) + "s");

    try {
        Lease first(*this);
    } catch (const RegistrationStoreError& e) {
        log_line(std::string("[STORE][redis] ") + e.what());
        return false;
    }
    return true;
}

RegistrationStore::Connection RegistrationStore::open_connection() const {
    timeval tv{};
    tv.tv_sec  = _redis.timeout_ms / 1000;
    tv.tv_usec = (_redis.timeout_ms % 1000) * 1000;

    Connection c(redisConnectWithTimeout(_redis.host.c_str(), _redis.port, tv));
    if (!c) {
        log_line("[STORE][redis] cannot allocate a connection context");
        return nullptr;
    }
    if (c->err) {
        log_line("[STORE][redis] connect " + _redis.host + ":" + std::to_string(_redis.port) +
                 ": " + c->errstr);
        return nullptr;
    }
    if (redisSetTimeout(c.get(), tv) != REDIS_OK) {
        log_line("[STORE][redis] cannot set command timeout");
    }
    if (!_redis.password.empty() && !setup(c.get(), {"AUTH", _redis.password})) return nullptr;
    if (_redis.db != 0 && !setup(c.get(), {"SELECT", std::to_string(_redis.db)})) return nullptr;
    return c;
}

RegistrationStore::Lease::Lease(RegistrationStore& store) : _store(store) {
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&] {
        return !store._idle.empty() || store._open < store._redis.pool_size;
    });
    if (!store._idle.empty()) {
        _conn = std::move(store._idle.back());
        store._idle.pop_back();
        return;
    }
    ++store._open;
    lk.unlock();

    _conn = store.open_connection();
    if (!_conn) {
        {
            std::lock_guard<std::mutex> relock(store._pool_mtx);
            --store._open;
        }
        store._pool_cv.notify_one();
        throw RegistrationStoreError("redis unavailable at " + store._redis.host + ":" +
                                     std::to_string(store._redis.port));
    }
}

RegistrationStore::Lease::~Lease() {
    {
        std::lock_guard<std::mutex> lk(_store._pool_mtx);
        if (_conn && _conn->err == 0) {
            _store._idle.push_back(std::move(_conn));
        } else {
            --_store._open;
        }
    }
    _conn.reset();
    _store._pool_cv.notify_one();
}

RegistrationPtr RegistrationStore::redis_fetch(const std::string& registration_id) {
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        auto it = _cache.find(registration_id);
        if (it != _cache.end()) {
            if (std::chrono::steady_clock::now() < it->second.expires) {
                return it->second.registration;
            }
            _cache.erase(it);
        }
    }

    const std::string key = _redis.key_prefix + registration_id;
    std::map<std::string, std::string> fields;
    {
        Lease lease(*this);
        Reply r = command(lease.get(), {"HGETALL", key});
        if (!r) {
            throw RegistrationStoreError("redis HGETALL " + key + ": " + lease.get()->errstr);
        }
        if (r->type == REDIS_REPLY_ERROR) {
            throw RegistrationStoreError("redis HGETALL " + key + ": " + reply_text(r.get()));
        }
        if (r->type != REDIS_REPLY_ARRAY) {
            throw RegistrationStoreError("redis HGETALL " + key + ": unexpected reply type " +
                                         std::to_string(r->type));
        }
        for (size_t i = 0; i + 1 < r->elements; i += 2) {
            fields[reply_text(r->element[i])] = reply_text(r->element[i + 1]);
        }
    }
    if (fields.empty()) return nullptr;   // no such hash

    RegistrationPtr reg = internal::registration_from_fields(registration_id, fields);
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache[registration_id] = Cached{
            reg, std::chrono::steady_clock::now() + std::chrono::seconds(_redis.cache_ttl_sec)};
    }
    return reg;
}

/* ---------------- Lookup ---------------- */

RegistrationPtr RegistrationStore::lookup(const std::string& registration_id) {
    if (_backend == Backend::File) {
        std::lock_guard<std::mutex> lk(_file_mtx);
        auto it = _file_map.find(registration_id);
        if (it == _file_map.end()) return nullptr;
        return it->second;
    }
    if (_backend == Backend::Redis) {
        return redis_fetch(registration_id);
    }
    return nullptr;
}

std::future<RegistrationPtr> RegistrationStore::get_registration_by_id(const std::string& id) {
    return std::async(std::launch::deferred, [this, id]() {
        RegistrationPtr reg = lookup(id);
        if (!reg) throw RegistrationNotFound(id);
        return reg;
    });
}

} // namespace ot
