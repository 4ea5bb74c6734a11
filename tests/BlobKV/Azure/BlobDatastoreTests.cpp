// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/BlobDatastore.hpp"
#include "BlobKV/Core/Errors.hpp"
#include "BlobKV/Core/Fakes/InMemoryContainerClient.hpp"
#include "BlobKV/Core/Mocks/BlobClientMock.hpp"
#include "BlobKV/Core/Mocks/ContainerClientMock.hpp"
#include "BlobKV/Core/DatastoreConformanceTests.hpp"

#include <azure/core/exception.hpp>
#include <gtest/gtest.h>
#include <gmock/gmock.h>
using boost::log::trivial::severity_level;
using boost::log::sources::severity_logger_mt;
using BlobKV::Azure::BlobDatastore;
using BlobKV::Azure::Impl::BlobDatastoreImpl;
using BlobKV::Core::Fakes::InMemoryContainerClient;
using BlobKV::Core::Mocks::BlobClientMock;
using BlobKV::Core::Mocks::ContainerClientMock;
using BlobKV::Core::Testing::DatastoreConformanceTests;
using BlobKV::Core::Testing::DatastoreFactory;
using BlobKV::Core::Testing::FactoryName;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

static std::unique_ptr<BlobKV::Core::Datastore> CreateOverInMemoryContainer(size_t pageSize, size_t maxConcurrentFetches)
{
    auto logger = std::make_shared<severity_logger_mt<severity_level>>();
    auto impl = std::make_unique<BlobDatastoreImpl>(std::make_shared<InMemoryContainerClient>(pageSize),
        logger,
        maxConcurrentFetches,
        static_cast<int32_t>(pageSize),
        2);
    return std::make_unique<BlobDatastore>(std::move(impl), logger);
}

INSTANTIATE_TEST_SUITE_P(BlobDatastore,
    DatastoreConformanceTests,
    ::testing::Values(
        DatastoreFactory{ "SinglePage", []() { return CreateOverInMemoryContainer(1000, 16); } },
        DatastoreFactory{ "PagesOfTwo", []() { return CreateOverInMemoryContainer(2, 3); } },
        DatastoreFactory{ "SerialFetch", []() { return CreateOverInMemoryContainer(3, 1); } }),
    FactoryName);

class BlobDatastoreTests : public ::testing::Test
{
protected:
    std::shared_ptr<NiceMock<ContainerClientMock>> m_container;
    std::shared_ptr<severity_logger_mt<severity_level>> m_logger;

    BlobDatastoreTests()
        : m_container(std::make_shared<NiceMock<ContainerClientMock>>()),
        m_logger(std::make_shared<severity_logger_mt<severity_level>>())
    {
    }

    BlobDatastore CreateDatastore()
    {
        return BlobDatastore(std::make_unique<BlobDatastoreImpl>(m_container, m_logger), m_logger);
    }

    void ServeBlob(std::unique_ptr<BlobClientMock> blob)
    {
        EXPECT_CALL(*m_container, GetBlobClient(_))
            .WillOnce(Return(::testing::ByMove(std::unique_ptr<BlobKV::Core::BlobClient>(std::move(blob)))));
    }
};

TEST_F(BlobDatastoreTests, Put_RequestFailed_IsRethrown)
{
    // Arrange
    auto blob = std::make_unique<BlobClientMock>();
    EXPECT_CALL(*blob, Upload(_))
        .WillOnce(Throw(::Azure::Core::RequestFailedException("server busy")));
    ServeBlob(std::move(blob));
    auto datastore = CreateDatastore();

    // Act & Assert
    EXPECT_THROW(datastore.Put("/k", std::vector<char>{ 'v' }), ::Azure::Core::RequestFailedException);
}

TEST_F(BlobDatastoreTests, Delete_RequestFailed_IsRethrown)
{
    // Arrange
    auto blob = std::make_unique<BlobClientMock>();
    EXPECT_CALL(*blob, Delete())
        .WillOnce(Throw(::Azure::Core::RequestFailedException("lease present")));
    ServeBlob(std::move(blob));
    auto datastore = CreateDatastore();

    // Act & Assert
    EXPECT_THROW(datastore.Delete("/k"), ::Azure::Core::RequestFailedException);
}

TEST_F(BlobDatastoreTests, DiskUsage_IsUnsupported)
{
    auto datastore = CreateDatastore();
    EXPECT_THROW((void)datastore.DiskUsage(), BlobKV::Core::UnsupportedError);
}

TEST_F(BlobDatastoreTests, Batch_StopsAtFirstFailure)
{
    // Arrange
    auto failing = std::make_unique<BlobClientMock>();
    EXPECT_CALL(*failing, Upload(_))
        .WillOnce(Throw(::Azure::Core::RequestFailedException("server busy")));
    ServeBlob(std::move(failing));
    auto datastore = CreateDatastore();
    auto batch = datastore.Batch();
    batch->Put("/a", std::vector<char>{ 'a' });
    batch->Put("/b", std::vector<char>{ 'b' });

    // Act & Assert
    EXPECT_THROW(batch->Commit(), ::Azure::Core::RequestFailedException);
}
