/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ot/certificate.hpp"
#include "ot/types.hpp"

namespace ot {

namespace internal { class TlsClientContext; }

// Node of an outbound handler chain.
class MessageHandler {
public:
    virtual ~MessageHandler() = default;
    virtual const char* type_name() const = 0;
};

// Default primary handler of the factory. Cannot carry client certificates.
class SocketsHandler : public MessageHandler {
public:
    const char* type_name() const override { return "ot::SocketsHandler"; }

    bool use_cookies() const { return _use_cookies; }
    void set_use_cookies(bool v) { _use_cookies = v; }

    DecompressionMethods automatic_decompression() const { return _decompression; }
    void set_automatic_decompression(DecompressionMethods m) { _decompression = m; }

private:
    bool _use_cookies = true;
    DecompressionMethods _decompression = DecompressionMethods::None;
};

// Certificate-capable primary handler. Owns the TLS client settings used
// when a connection is opened.
class ClientHandler : public MessageHandler {
public:
    explicit ClientHandler(bool supports_automatic_decompression = true);
    ~ClientHandler() override;

    const char* type_name() const override { return "ot::ClientHandler"; }

    ClientCertificateOption client_certificate_options() const { return _cert_option; }
    void set_client_certificate_options(ClientCertificateOption o) { _cert_option = o; }

    const std::vector<Certificate>& client_certificates() const { return _client_certs; }
    void add_client_certificate(Certificate cert) { _client_certs.push_back(std::move(cert)); }

    bool supports_automatic_decompression() const { return _supports_decompression; }
    DecompressionMethods automatic_decompression() const { return _decompression; }
    // Ignored when decompression is not supported.
    void set_automatic_decompression(DecompressionMethods m);

    bool use_cookies() const { return _use_cookies; }
    void set_use_cookies(bool v) { _use_cookies = v; }

    // Server certificate verification
    bool verify_peer() const { return _verify_peer; }
    void set_verify_peer(bool v) { _verify_peer = v; }
    const std::string& ca_file() const { return _ca_file; }
    void set_ca_file(std::string path) { _ca_file = std::move(path); }

    // SSL_CTX for connections made through this handler. In Manual mode only the
    // first attached certificate (with its private key) is installed.
    // Returns nullptr and logs OpenSSL errors on failure.
    std::unique_ptr<internal::TlsClientContext> create_tls_context() const;

private:
    ClientCertificateOption   _cert_option = ClientCertificateOption::Automatic;
    std::vector<Certificate>  _client_certs;
    bool                      _supports_decompression;
    DecompressionMethods      _decompression = DecompressionMethods::None;
    bool                      _use_cookies = true;
    bool                      _verify_peer = true;
    std::string               _ca_file;
};

// Handler that forwards to an inner handler.
class DelegatingHandler : public MessageHandler {
public:
    const std::shared_ptr<MessageHandler>& inner() const { return _inner; }
    void set_inner(std::shared_ptr<MessageHandler> h) { _inner = std::move(h); }

private:
    std::shared_ptr<MessageHandler> _inner;
};

// Retry policy objects are opaque here; the host runs them.
class HttpErrorPolicy {
public:
    virtual ~HttpErrorPolicy() = default;
    virtual std::string name() const = 0;
};

class ResiliencePipeline {
public:
    virtual ~ResiliencePipeline() = default;
    virtual std::string name() const = 0;
};

// Runs requests through a legacy error policy.
class PolicyHandler : public DelegatingHandler {
public:
    explicit PolicyHandler(std::shared_ptr<const HttpErrorPolicy> policy) : _policy(std::move(policy)) {}
    const char* type_name() const override { return "ot::PolicyHandler"; }
    const std::shared_ptr<const HttpErrorPolicy>& policy() const { return _policy; }

private:
    std::shared_ptr<const HttpErrorPolicy> _policy;
};

// Runs requests through a resilience pipeline.
class ResilienceHandler : public DelegatingHandler {
public:
    explicit ResilienceHandler(std::shared_ptr<const ResiliencePipeline> pipeline) : _pipeline(std::move(pipeline)) {}
    const char* type_name() const override { return "ot::ResilienceHandler"; }
    const std::shared_ptr<const ResiliencePipeline>& pipeline() const { return _pipeline; }

private:
    std::shared_ptr<const ResiliencePipeline> _pipeline;
};

// Mutable description of a handler chain while it is being built.
class HandlerBuilder {
public:
    explicit HandlerBuilder(std::string name);

    const std::string& name() const { return _name; }

    const std::shared_ptr<MessageHandler>& primary_handler() const { return _primary; }
    void set_primary_handler(std::shared_ptr<MessageHandler> h) { _primary = std::move(h); }

    // Outermost first.
    std::vector<std::shared_ptr<DelegatingHandler>>& additional_handlers() { return _additional; }
    const std::vector<std::shared_ptr<DelegatingHandler>>& additional_handlers() const { return _additional; }

    // Links additional handlers in order down to the primary handler and returns
    // the outermost handler. Throws ot::ConfigurationError without a primary handler.
    std::shared_ptr<MessageHandler> build();

private:
    std::string _name;
    std::shared_ptr<MessageHandler> _primary;
    std::vector<std::shared_ptr<DelegatingHandler>> _additional;
};

// Primary handler as ClientHandler, or nullptr.
ClientHandler* as_client_handler(const HandlerBuilder& builder);

} // namespace ot
