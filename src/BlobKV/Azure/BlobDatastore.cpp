// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/BlobDatastore.hpp"
#include "BlobKV/Azure/Impl/AzureContainerClient.hpp"
#include "BlobKV/Azure/Impl/BlobHelpers.hpp"
#include "BlobKV/Core/Batch.hpp"
#include "BlobKV/Core/Errors.hpp"

#include <azure/core/exception.hpp>
#include <boost/log/trivial.hpp>
namespace BlobKV::Azure
{
    using namespace boost::log::trivial;

    template <typename TStorageInfo>
    static std::unique_ptr<Impl::BlobDatastoreImpl> Connect(const TStorageInfo& storageInfo,
        const std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>& logger)
    {
        try
        {
            const auto serviceClient = Impl::BlobHelpers::CreateServiceClient(storageInfo);
            auto container = std::make_shared<Impl::AzureContainerClient>(
                Impl::BlobHelpers::GetContainerClient(serviceClient, storageInfo.GetContainerName()));
            return std::make_unique<Impl::BlobDatastoreImpl>(std::move(container), logger);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*logger, error) << "Unable to open container '" << storageInfo.GetContainerName() << "' "
                << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    BlobDatastore::BlobDatastore(const Models::SharedKeyStorageInfo& storageInfo,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : BlobDatastore(Connect(storageInfo, logger), logger)
    {
    }

    BlobDatastore::BlobDatastore(const Models::ServicePrincipalStorageInfo& storageInfo,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : BlobDatastore(Connect(storageInfo, logger), logger)
    {
    }

    BlobDatastore::BlobDatastore(std::unique_ptr<Impl::BlobDatastoreImpl> datastore,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_datastore(std::move(datastore)),
        m_logger(std::move(logger))
    {
    }

    void BlobDatastore::Put(const std::string& key, std::span<const char> value)
    {
        try
        {
            m_datastore->Put(key, value);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    std::vector<char> BlobDatastore::Get(const std::string& key)
    {
        try
        {
            return m_datastore->Get(key);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    bool BlobDatastore::Has(const std::string& key)
    {
        try
        {
            return m_datastore->Has(key);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    int64_t BlobDatastore::GetSize(const std::string& key)
    {
        try
        {
            return m_datastore->GetSize(key);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    void BlobDatastore::Delete(const std::string& key)
    {
        try
        {
            m_datastore->Delete(key);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw;
        }
    }

    std::unique_ptr<Core::Results> BlobDatastore::Query(const Core::Query& query)
    {
        return m_datastore->Query(query);
    }

    std::unique_ptr<Core::WriteBatch> BlobDatastore::Batch()
    {
        return std::make_unique<Core::BasicBatch>(*this);
    }

    void BlobDatastore::Sync(const std::string&)
    {
    }

    void BlobDatastore::Close()
    {
    }

    uint64_t BlobDatastore::DiskUsage()
    {
        throw Core::UnsupportedError("DiskUsage");
    }
}
