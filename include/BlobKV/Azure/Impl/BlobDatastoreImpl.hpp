// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Azure/Impl/Configuration.hpp"
#include "BlobKV/Core/ContainerClient.hpp"
#include "BlobKV/Core/Results.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace BlobKV::Azure::Impl
{
    /// <summary>
    /// Datastore operations on a single blob container. Every key is one block blob.
    /// </summary>
    class BlobDatastoreImpl
    {
        std::shared_ptr<Core::ContainerClient> m_container;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        size_t m_maxConcurrentFetches;
        int32_t m_pageSizeHint;
        size_t m_resultBufferSize;

    public:
        /// <summary>
        /// Creates the container if it does not exist yet.
        /// </summary>
        /// <param name="container">The container the datastore owns.</param>
        /// <param name="logger">Logger for container creation and listing.</param>
        /// <param name="maxConcurrentFetches">Upper bound on value downloads in flight for a query.</param>
        /// <param name="pageSizeHint">Number of blobs requested per listing page.</param>
        /// <param name="resultBufferSize">Number of query results buffered ahead of the consumer.</param>
        BlobDatastoreImpl(std::shared_ptr<Core::ContainerClient> container,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            size_t maxConcurrentFetches = Configuration::Query::MaxConcurrentFetches,
            int32_t pageSizeHint = Configuration::Query::ListPageSizeHint,
            size_t resultBufferSize = Configuration::Query::ResultBufferSize);

        void Put(const std::string& key, std::span<const char> value);
        [[nodiscard]] std::vector<char> Get(const std::string& key);
        [[nodiscard]] bool Has(const std::string& key);
        [[nodiscard]] int64_t GetSize(const std::string& key);
        void Delete(const std::string& key);

        /// <summary>
        /// Lists the container page by page on a background thread. Values are downloaded concurrently,
        /// at most maxConcurrentFetches at a time, and every download of a page finishes before the
        /// next page is listed. A failed download is reported on its own result.
        /// </summary>
        [[nodiscard]] std::unique_ptr<Core::Results> Query(const Core::Query& query);
    };
}
