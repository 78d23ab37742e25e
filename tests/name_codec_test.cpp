/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "ot/name_codec.hpp"

namespace {

const std::string RS(1, ot::kPairSeparator);
const std::string US(1, ot::kEntrySeparator);

} // namespace

TEST(NameCodec, EncodeLayout) {
    ot::PropertyBag props{{"a", "1"}, {"b", "2"}};
    EXPECT_EQ(ot::encode_name("pfx", props), "pfx:a" + RS + "1" + US + "b" + RS + "2");
}

TEST(NameCodec, EncodeEmptyBag) {
    EXPECT_EQ(ot::encode_name("pfx", {}), "pfx:");
}

TEST(NameCodec, DecodeRestoresEncodedBag) {
    ot::PropertyBag props{
        {ot::kRegistrationIdProperty, "reg-1"},
        {ot::kAttachTlsClientCertificateProperty, "true"},
        {"Custom", "some value"},
    };
    EXPECT_EQ(ot::decode_name(ot::encode_name("pfx", props), "pfx"), props);
}

TEST(NameCodec, UnmanagedNamesDecodeEmpty) {
    const std::string body = ot::kRegistrationIdProperty + RS + "reg-1";
    EXPECT_TRUE(ot::decode_name("", "pfx").empty());
    EXPECT_TRUE(ot::decode_name("pfx", "pfx").empty());
    EXPECT_TRUE(ot::decode_name("pfx" + body, "pfx").empty());
    EXPECT_TRUE(ot::decode_name("pfx2:" + body, "pfx").empty());
    EXPECT_TRUE(ot::decode_name("other:" + body, "pfx").empty());
    EXPECT_TRUE(ot::decode_name("PFX:" + body, "pfx").empty());
}

TEST(NameCodec, ManagedNameDetection) {
    EXPECT_TRUE(ot::is_managed_name("pfx:", "pfx"));
    EXPECT_TRUE(ot::is_managed_name("pfx:x", "pfx"));
    EXPECT_FALSE(ot::is_managed_name("pfx", "pfx"));
    EXPECT_FALSE(ot::is_managed_name("pfxx:", "pfx"));
    EXPECT_FALSE(ot::is_managed_name("other", "pfx"));
    EXPECT_TRUE(ot::is_managed_name(std::string(ot::kDefaultNamePrefix) + ":", ot::kDefaultNamePrefix));
}

TEST(NameCodec, MalformedEntriesAreDropped) {
    const std::string name = "pfx:" +
        std::string(ot::kRegistrationIdProperty) + RS + "reg-1" + US +
        ot::kAttachTlsClientCertificateProperty + US +       // no value
        "a" + RS + "b" + RS + "c" + US +                     // three parts
        RS + "orphan";                                       // empty key
    ot::PropertyBag bag = ot::decode_name(name, "pfx");
    ASSERT_EQ(bag.size(), 1u);
    EXPECT_EQ(bag[ot::kRegistrationIdProperty], "reg-1");
}

TEST(NameCodec, EmptyFragmentsAreSkipped) {
    const std::string name = "pfx:" + US + US + "k" + RS + RS + "v" + US;
    ot::PropertyBag bag = ot::decode_name(name, "pfx");
    ASSERT_EQ(bag.size(), 1u);
    EXPECT_EQ(bag["k"], "v");
}

TEST(NameCodec, DuplicateKeysKeepLastValue) {
    const std::string name = "pfx:k" + RS + "first" + US + "k" + RS + "second";
    ot::PropertyBag bag = ot::decode_name(name, "pfx");
    ASSERT_EQ(bag.size(), 1u);
    EXPECT_EQ(bag["k"], "second");
}

TEST(NameCodec, PropertyFlag) {
    ot::PropertyBag bag{
        {"a", "true"}, {"b", "True"}, {"c", " TRUE "}, {"d", "false"},
        {"e", "1"}, {"f", "yes"}, {"g", ""},
    };
    EXPECT_TRUE(ot::property_flag(bag, "a"));
    EXPECT_TRUE(ot::property_flag(bag, "b"));
    EXPECT_TRUE(ot::property_flag(bag, "c"));
    EXPECT_FALSE(ot::property_flag(bag, "d"));
    EXPECT_FALSE(ot::property_flag(bag, "e"));
    EXPECT_FALSE(ot::property_flag(bag, "f"));
    EXPECT_FALSE(ot::property_flag(bag, "g"));
    EXPECT_FALSE(ot::property_flag(bag, "missing"));
}
