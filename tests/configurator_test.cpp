/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */


#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "ot/configurator.hpp"
#include "ot/errors.hpp"
#include "ot/name_codec.hpp"
#include "test_certs.hpp"

using namespace std::chrono_literals;

namespace {

const std::string RS(1, ot::kPairSeparator);
const std::string US(1, ot::kEntrySeparator);

ot::test::CertProfile profile_for(const std::string& cn, bool self_issued) {
    ot::test::CertProfile profile;
    profile.subject_cn = cn;
    if (!self_issued) profile.issuer_cn = "Test CA";
    return profile;
}

struct NamedPolicy : ot::HttpErrorPolicy {
    std::string name() const override { return "retry-3"; }
};

struct NamedPipeline : ot::ResiliencePipeline {
    std::string name() const override { return "standard"; }
};

// Records the threads resolution runs on.
class RecordingResolver : public ot::RegistrationResolver {
public:
    explicit RecordingResolver(std::shared_ptr<ot::RegistrationResolver> inner) : _inner(std::move(inner)) {}

    std::future<ot::RegistrationPtr> get_registration_by_id(const std::string& id) override {
        {
            std::lock_guard<std::mutex> lk(_mtx);
            _threads.push_back(std::this_thread::get_id());
        }
        return _inner->get_registration_by_id(id);
    }

    std::vector<std::thread::id> threads() {
        std::lock_guard<std::mutex> lk(_mtx);
        return _threads;
    }

private:
    std::shared_ptr<ot::RegistrationResolver> _inner;
    std::mutex _mtx;
    std::vector<std::thread::id> _threads;
};

// Swaps the primary handler for one that cannot carry certificates.
class SocketsPrimaryConfigurator : public ot::FactoryConfigurator {
public:
    void configure(const std::string&, ot::FactoryOptions& options) override {
        options.handler_builder_actions.push_back([](ot::HandlerBuilder& b) {
            b.set_primary_handler(std::make_shared<ot::SocketsHandler>());
        });
    }
    void post_configure(const std::string&, ot::FactoryOptions&) override {}
};

} // namespace

class TransportConfiguratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto reg = std::make_shared<ot::ClientRegistration>();
        reg->registration_id = "reg-1";
        reg->issuer = "https://issuer.example/";
        reg->signing_credentials = {
            ot::test::credential(self_signed),
            ot::test::credential(standard),
        };
        memory->add(reg);
        resolver = std::make_shared<RecordingResolver>(memory);
    }

    std::string name(const std::string& prefix, const ot::PropertyBag& props) const {
        return ot::encode_name(prefix, props);
    }

    std::shared_ptr<ot::TransportFactory> make_factory(ot::TransportOptionsBuilder& builder,
                                                       std::chrono::milliseconds lifetime = 2min) {
        auto factory = std::make_shared<ot::TransportFactory>(lifetime);
        factory->add_configurator(std::make_shared<ot::TransportConfigurator>(
            ot::ConfigurationContext{resolver, builder.set_name_prefix("pfx").build()}));
        return factory;
    }

    static ot::ClientHandler* client_handler(const ot::HttpClient& client) {
        return dynamic_cast<ot::ClientHandler*>(client.primary_handler());
    }

    ot::Certificate self_signed = ot::test::make_certificate(profile_for("self", true));
    ot::Certificate standard = ot::test::make_certificate(profile_for("standard", false));
    std::shared_ptr<ot::InMemoryRegistrationResolver> memory = std::make_shared<ot::InMemoryRegistrationResolver>();
    std::shared_ptr<RecordingResolver> resolver;
};

TEST_F(TransportConfiguratorTest, EndToEndTlsClientAuth) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    const std::string n = "pfx:RegistrationId" + RS + "reg-1" + US + "AttachTlsClientCertificate" + RS + "true";
    auto client = factory->create_client(n);

    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    ASSERT_EQ(handler->client_certificates().size(), 1u);
    EXPECT_EQ(handler->client_certificates().front(), standard);
    EXPECT_EQ(handler->client_certificate_options(), ot::ClientCertificateOption::Manual);
    EXPECT_FALSE(handler->use_cookies());
    EXPECT_EQ(handler->automatic_decompression(), ot::DecompressionMethods::None);
    EXPECT_EQ(client->timeout(), 60s);
    EXPECT_EQ(client->max_response_content_buffer_size(), 10u * 1024 * 1024);
}

TEST_F(TransportConfiguratorTest, SelfSignedTlsClientAuth) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    auto client = factory->create_client(name("pfx", {
        {ot::kRegistrationIdProperty, "reg-1"},
        {ot::kAttachSelfSignedTlsClientCertificateProperty, "True"},
    }));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    ASSERT_EQ(handler->client_certificates().size(), 1u);
    EXPECT_EQ(handler->client_certificates().front(), self_signed);
}

TEST_F(TransportConfiguratorTest, StandardCertificateWinsWhenBothFlagsSet) {
    std::atomic<int> self_calls{0};
    ot::TransportOptionsBuilder builder;
    builder.set_self_signed_tls_client_auth_selector([&](const ot::ClientRegistration& r) {
        ++self_calls;
        return ot::select_self_signed_tls_client_certificate(r);
    });
    auto factory = make_factory(builder);

    auto client = factory->create_client(name("pfx", {
        {ot::kRegistrationIdProperty, "reg-1"},
        {ot::kAttachTlsClientCertificateProperty, "true"},
        {ot::kAttachSelfSignedTlsClientCertificateProperty, "true"},
    }));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    ASSERT_EQ(handler->client_certificates().size(), 1u);
    EXPECT_EQ(handler->client_certificates().front(), standard);
    EXPECT_EQ(self_calls.load(), 0);
}

TEST_F(TransportConfiguratorTest, NoFlagsAttachesNothing) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    auto client = factory->create_client(name("pfx", {
        {ot::kRegistrationIdProperty, "reg-1"},
        {ot::kAttachTlsClientCertificateProperty, "false"},
    }));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    EXPECT_TRUE(handler->client_certificates().empty());
    EXPECT_EQ(handler->client_certificate_options(), ot::ClientCertificateOption::Manual);
    EXPECT_EQ(client->timeout(), 60s);
}

TEST_F(TransportConfiguratorTest, NoEligibleCertificate) {
    auto reg = std::make_shared<ot::ClientRegistration>();
    reg->registration_id = "reg-2";
    reg->signing_credentials = {ot::test::credential(self_signed)};
    memory->add(reg);

    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);
    auto client = factory->create_client(ot::transport_name("pfx", "reg-2", ot::ClientAuthenticationMethod::TlsClientAuth));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    EXPECT_TRUE(handler->client_certificates().empty());
}

TEST_F(TransportConfiguratorTest, UnmanagedNameIsLeftAlone) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    for (const std::string n : {std::string("other"),
                                std::string(ot::kDefaultNamePrefix) + ":RegistrationId" + RS + "reg-1"}) {
        auto client = factory->create_client(n);
        EXPECT_EQ(client_handler(*client), nullptr);
        auto* sockets = dynamic_cast<ot::SocketsHandler*>(client->primary_handler());
        ASSERT_NE(sockets, nullptr);
        EXPECT_TRUE(sockets->use_cookies());
        EXPECT_EQ(client->timeout(), ot::HttpClient::kFrameworkTimeout);
        EXPECT_EQ(client->max_response_content_buffer_size(), ot::HttpClient::kUnboundedBufferSize);
    }
    EXPECT_TRUE(resolver->threads().empty());
}

TEST_F(TransportConfiguratorTest, ManagedNameWithoutRegistrationIsOnlyHardened) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    auto client = factory->create_client(name("pfx", {{"Other", "x"}}));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    EXPECT_FALSE(handler->use_cookies());
    EXPECT_EQ(handler->client_certificate_options(), ot::ClientCertificateOption::Automatic);
    EXPECT_EQ(client->timeout(), ot::HttpClient::kFrameworkTimeout);
    EXPECT_TRUE(resolver->threads().empty());
}

TEST_F(TransportConfiguratorTest, UnknownRegistrationFails) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);
    const std::string n = ot::transport_name("pfx", "missing", ot::ClientAuthenticationMethod::ClientSecretBasic);

    try {
        factory->create_client(n);
        FAIL() << "expected RegistrationNotFound";
    } catch (const ot::RegistrationNotFound& e) {
        EXPECT_EQ(e.registration_id(), "missing");
    }

    // Nothing is cached for the failed name.
    auto reg = std::make_shared<ot::ClientRegistration>();
    reg->registration_id = "missing";
    memory->add(reg);
    EXPECT_NE(factory->create_client(n), nullptr);
}

TEST_F(TransportConfiguratorTest, RemovedRegistrationFailsForNewNames) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);

    EXPECT_NE(factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::TlsClientAuth)), nullptr);
    EXPECT_TRUE(memory->remove("reg-1"));
    EXPECT_FALSE(memory->remove("reg-1"));
    EXPECT_THROW(factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::SelfSignedTlsClientAuth)),
                 ot::RegistrationNotFound);
}

TEST_F(TransportConfiguratorTest, ResolutionRunsOffTheCallingThreadOncePerName) {
    ot::TransportOptionsBuilder builder;
    auto factory = make_factory(builder);
    const std::string n = ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::TlsClientAuth);

    factory->create_client(n);
    factory->create_client(n);

    auto threads = resolver->threads();
    ASSERT_EQ(threads.size(), 1u);
    EXPECT_NE(threads.front(), std::this_thread::get_id());
}

TEST_F(TransportConfiguratorTest, UserClientActionsOverrideDefaults) {
    std::vector<std::string> seen;
    ot::TransportOptionsBuilder builder;
    builder.add_client_action([&](const ot::ClientRegistration& r, ot::HttpClient& c) {
        seen.push_back(r.registration_id);
        EXPECT_EQ(c.timeout(), 60s);
        c.set_timeout(5min);
    });
    builder.add_client_action([&](const ot::ClientRegistration&, ot::HttpClient& c) {
        seen.push_back("second");
        EXPECT_EQ(c.timeout(), 5min);
    });
    auto factory = make_factory(builder);

    auto client = factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::ClientSecretBasic));
    EXPECT_EQ(client->timeout(), 5min);
    EXPECT_EQ(seen, (std::vector<std::string>{"reg-1", "second"}));
}

TEST_F(TransportConfiguratorTest, UserHandlerActionsRunAfterAttachmentAndBeforeHardening) {
    std::size_t certs_seen = 0;
    ot::TransportOptionsBuilder builder;
    builder.add_handler_action([&](const ot::ClientRegistration& r, ot::ClientHandler& h) {
        EXPECT_EQ(r.registration_id, "reg-1");
        EXPECT_EQ(h.client_certificate_options(), ot::ClientCertificateOption::Manual);
        certs_seen = h.client_certificates().size();
        h.set_use_cookies(true);
        h.set_automatic_decompression(ot::DecompressionMethods::All);
    });
    auto factory = make_factory(builder);

    auto client = factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::TlsClientAuth));
    auto* handler = client_handler(*client);
    ASSERT_NE(handler, nullptr);
    EXPECT_EQ(certs_seen, 1u);
    EXPECT_FALSE(handler->use_cookies());
    EXPECT_EQ(handler->automatic_decompression(), ot::DecompressionMethods::None);
}

TEST_F(TransportConfiguratorTest, ErrorPolicyIsAttached) {
    auto policy = std::make_shared<NamedPolicy>();
    ot::TransportOptionsBuilder builder;
    builder.set_http_error_policy(policy);
    auto factory = make_factory(builder);

    auto client = factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::ClientSecretBasic));
    auto top = std::dynamic_pointer_cast<ot::PolicyHandler>(client->handler());
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->policy(), policy);
    EXPECT_NE(dynamic_cast<ot::ClientHandler*>(top->inner().get()), nullptr);
}

TEST_F(TransportConfiguratorTest, ResiliencePipelineIsAttached) {
    auto pipeline = std::make_shared<NamedPipeline>();
    ot::TransportOptionsBuilder builder;
    builder.set_resilience_pipeline(pipeline);
    auto factory = make_factory(builder);

    auto client = factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::ClientSecretBasic));
    auto top = std::dynamic_pointer_cast<ot::ResilienceHandler>(client->handler());
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->pipeline(), pipeline);
}

TEST_F(TransportConfiguratorTest, ErrorPolicyWinsOverPipeline) {
    ot::TransportOptionsBuilder builder;
    builder.set_http_error_policy(std::make_shared<NamedPolicy>());
    builder.set_resilience_pipeline(std::make_shared<NamedPipeline>());
    auto factory = make_factory(builder);

    auto client = factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::ClientSecretBasic));
    auto top = std::dynamic_pointer_cast<ot::PolicyHandler>(client->handler());
    ASSERT_NE(top, nullptr);
    EXPECT_NE(dynamic_cast<ot::ClientHandler*>(top->inner().get()), nullptr);
}

TEST_F(TransportConfiguratorTest, SelectionRunsOnEveryBuild) {
    std::atomic<int> calls{0};
    ot::TransportOptionsBuilder builder;
    builder.set_tls_client_auth_selector([&](const ot::ClientRegistration&) -> std::optional<ot::Certificate> {
        ++calls;
        return self_signed;
    });
    auto factory = make_factory(builder, 0ms);
    const std::string n = ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::TlsClientAuth);

    auto first = factory->create_client(n);
    auto second = factory->create_client(n);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_NE(first->handler(), second->handler());

    auto* handler = client_handler(*second);
    ASSERT_NE(handler, nullptr);
    ASSERT_EQ(handler->client_certificates().size(), 1u);
    EXPECT_EQ(handler->client_certificates().front(), self_signed);
}

TEST_F(TransportConfiguratorTest, ForeignPrimaryHandlerIsFatal) {
    ot::TransportOptionsBuilder builder;
    auto factory = std::make_shared<ot::TransportFactory>();
    factory->add_configurator(std::make_shared<SocketsPrimaryConfigurator>());
    factory->add_configurator(std::make_shared<ot::TransportConfigurator>(
        ot::ConfigurationContext{resolver, builder.set_name_prefix("pfx").build()}));

    try {
        factory->create_client(ot::transport_name("pfx", "reg-1", ot::ClientAuthenticationMethod::TlsClientAuth));
        FAIL() << "expected ConfigurationError";
    } catch (const ot::ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("ot::SocketsHandler"), std::string::npos);
    }
}

TEST_F(TransportConfiguratorTest, RejectsMissingContext) {
    ot::TransportOptionsBuilder builder;
    auto options = builder.build();
    EXPECT_THROW(ot::TransportConfigurator(ot::ConfigurationContext{nullptr, options}), std::invalid_argument);
    EXPECT_THROW(ot::TransportConfigurator(ot::ConfigurationContext{resolver, nullptr}), std::invalid_argument);
}

TEST(Hardening, Idempotent) {
    ot::ClientHandler h;
    h.set_automatic_decompression(ot::DecompressionMethods::GZip);
    ot::harden_client_handler(h);
    ot::harden_client_handler(h);
    EXPECT_FALSE(h.use_cookies());
    EXPECT_EQ(h.automatic_decompression(), ot::DecompressionMethods::None);
}

TEST(Hardening, WithoutDecompressionSupport) {
    ot::ClientHandler h(false);
    ot::harden_client_handler(h);
    EXPECT_FALSE(h.use_cookies());
    EXPECT_EQ(h.automatic_decompression(), ot::DecompressionMethods::None);
}
