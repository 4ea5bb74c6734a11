// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/Errors.hpp"
#include "IntegrationTestHelpers.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using BlobKV::Azure::Impl::Testing::AzureIntegrationTestBase;
using BlobKV::Core::NotFoundError;
using BlobKV::Core::OrderByKey;
using BlobKV::Core::Query;

class BlobDatastoreIntegrationTests : public AzureIntegrationTestBase
{
protected:
    static std::vector<char> Bytes(std::string_view text)
    {
        return { text.begin(), text.end() };
    }
};

TEST_F(BlobDatastoreIntegrationTests, MissingKey_IsAbsent)
{
    EXPECT_THROW((void)m_datastore->Get(Key("missing")), NotFoundError);
    EXPECT_FALSE(m_datastore->Has(Key("missing")));
    EXPECT_THROW((void)m_datastore->GetSize(Key("missing")), NotFoundError);
    EXPECT_NO_THROW(m_datastore->Delete(Key("missing")));
}

TEST_F(BlobDatastoreIntegrationTests, PutGetDelete_RoundTrip)
{
    // Arrange
    std::vector<char> value(4096);
    for (size_t i = 0; i < value.size(); ++i)
    {
        value[i] = static_cast<char>(i % 251);
    }

    // Act
    m_datastore->Put(Key("value"), value);
    const auto stored = m_datastore->Get(Key("value"));
    const auto size = m_datastore->GetSize(Key("value"));
    m_datastore->Delete(Key("value"));

    // Assert
    EXPECT_EQ(value, stored);
    EXPECT_EQ(static_cast<int64_t>(value.size()), size);
    EXPECT_FALSE(m_datastore->Has(Key("value")));
}

TEST_F(BlobDatastoreIntegrationTests, Put_Overwrite_LatestValueWins)
{
    // Arrange
    m_datastore->Put(Key("k"), Bytes("first"));

    // Act
    m_datastore->Put(Key("k"), Bytes("second"));

    // Assert
    EXPECT_EQ(Bytes("second"), m_datastore->Get(Key("k")));
}

TEST_F(BlobDatastoreIntegrationTests, Query_Prefix_ReturnsChildrenWithValues)
{
    // Arrange
    m_datastore->Put(Key("a/b"), Bytes("hello"));
    m_datastore->Put(Key("a/c"), Bytes("world"));
    m_datastore->Put(Key("ab"), Bytes("sibling"));

    // Act
    auto results = m_datastore->Query(Query{ .Prefix = Key("a"), .Orders = { std::make_shared<OrderByKey>() } });
    const auto entries = results->Rest();

    // Assert
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ(Key("a/b"), entries[0].Key);
    EXPECT_EQ(Bytes("hello"), entries[0].Value.value_or(std::vector<char>{}));
    EXPECT_EQ(Key("a/c"), entries[1].Key);
    EXPECT_EQ(Bytes("world"), entries[1].Value.value_or(std::vector<char>{}));
}

TEST_F(BlobDatastoreIntegrationTests, Query_KeysOnly_ReturnsEveryKey)
{
    // Arrange
    std::map<std::string, size_t> expected;
    for (int i = 0; i < 12; ++i)
    {
        const auto key = Key("keys/" + std::to_string(i));
        const auto value = Bytes(std::string(static_cast<size_t>(i), 'x'));
        m_datastore->Put(key, value);
        expected[key] = value.size();
    }

    // Act
    auto results = m_datastore->Query(Query{ .Prefix = Key("keys"), .KeysOnly = true });
    const auto entries = results->Rest();

    // Assert
    std::map<std::string, size_t> actual;
    for (const auto& entry : entries)
    {
        EXPECT_FALSE(entry.Value.has_value());
        actual[entry.Key] = static_cast<size_t>(entry.Size);
    }

    EXPECT_EQ(expected, actual);
}

TEST_F(BlobDatastoreIntegrationTests, Batch_Commit_AppliesOperations)
{
    // Arrange
    m_datastore->Put(Key("stale"), Bytes("old"));
    auto batch = m_datastore->Batch();
    batch->Put(Key("fresh"), Bytes("new"));
    batch->Delete(Key("stale"));

    // Act
    batch->Commit();

    // Assert
    EXPECT_TRUE(m_datastore->Has(Key("fresh")));
    EXPECT_FALSE(m_datastore->Has(Key("stale")));
}
