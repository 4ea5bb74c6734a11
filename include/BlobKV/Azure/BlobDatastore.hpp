// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Azure/Impl/BlobDatastoreImpl.hpp"
#include "BlobKV/Azure/Models/ServicePrincipalStorageInfo.hpp"
#include "BlobKV/Azure/Models/SharedKeyStorageInfo.hpp"
#include "BlobKV/Core/Datastore.hpp"

#include <boost/log/trivial.hpp>

#include <memory>
#include <string>
namespace BlobKV::Azure
{
    /// <summary>
    /// Datastore over a single Azure blob container. Keys are blob names.
    ///
    /// Backend failures are logged and rethrown. A missing blob is reported as Core::NotFoundError
    /// by Get and GetSize; every other Azure error reaches the caller unchanged.
    /// </summary>
    class BlobDatastore final : public Core::Datastore
    {
        std::unique_ptr<Impl::BlobDatastoreImpl> m_datastore;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        BlobDatastore(const Models::SharedKeyStorageInfo& storageInfo,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        BlobDatastore(const Models::ServicePrincipalStorageInfo& storageInfo,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        BlobDatastore(std::unique_ptr<Impl::BlobDatastoreImpl> datastore,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        BlobDatastore(const BlobDatastore&) = delete;
        BlobDatastore& operator=(const BlobDatastore&) = delete;
        BlobDatastore(BlobDatastore&&) noexcept = delete;
        BlobDatastore& operator=(BlobDatastore&&) = delete;

        virtual void Put(const std::string& key, std::span<const char> value) override;
        [[nodiscard]] virtual std::vector<char> Get(const std::string& key) override;
        [[nodiscard]] virtual bool Has(const std::string& key) override;
        [[nodiscard]] virtual int64_t GetSize(const std::string& key) override;
        virtual void Delete(const std::string& key) override;
        [[nodiscard]] virtual std::unique_ptr<Core::Results> Query(const Core::Query& query) override;
        [[nodiscard]] virtual std::unique_ptr<Core::WriteBatch> Batch() override;

        // Every Put is durable once it returns.
        virtual void Sync(const std::string& prefix) override;
        virtual void Close() override;

        /// <exception cref="Core::UnsupportedError">Always; blob storage has no cheap usage query.</exception>
        [[nodiscard]] virtual uint64_t DiskUsage() override;
    };
}
