// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/Impl/BlobDatastoreImpl.hpp"
#include "BlobKV/Azure/Impl/KeyMapping.hpp"
#include "BlobKV/Core/Errors.hpp"
#include "BlobKV/Core/ResultChannel.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <stop_token>
#include <thread>
namespace BlobKV::Azure::Impl
{
    using namespace boost::log::trivial;

    namespace
    {
        class PageLister
        {
            std::shared_ptr<Core::ContainerClient> m_container;
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
            std::string m_prefix;
            bool m_keysOnly;
            size_t m_maxConcurrentFetches;
            int32_t m_pageSizeHint;

        public:
            PageLister(std::shared_ptr<Core::ContainerClient> container,
                std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
                std::string prefix,
                bool keysOnly,
                size_t maxConcurrentFetches,
                int32_t pageSizeHint)
                : m_container(std::move(container)),
                m_logger(std::move(logger)),
                m_prefix(std::move(prefix)),
                m_keysOnly(keysOnly),
                m_maxConcurrentFetches(std::max<size_t>(maxConcurrentFetches, 1)),
                m_pageSizeHint(pageSizeHint)
            {
            }

            void operator()(std::stop_token stopToken, Core::ResultChannel& channel) const
            {
                std::optional<std::string> continuationToken;
                do
                {
                    if (stopToken.stop_requested())
                    {
                        return;
                    }

                    Core::BlobPage page;
                    try
                    {
                        page = m_container->ListBlobs(m_prefix, continuationToken, m_pageSizeHint, stopToken);
                    }
                    catch (const std::exception& ex)
                    {
                        BOOST_LOG_SEV(*m_logger, error) << "Listing blobs with prefix '" << m_prefix << "' failed: " << ex.what();
                        (void)channel.Push(Core::Result{ .Error = std::current_exception() });
                        return;
                    }

                    BOOST_LOG_SEV(*m_logger, debug) << "Listed " << page.Blobs.size() << " blobs with prefix '" << m_prefix << "'";
                    const bool delivered = m_keysOnly
                        ? PushKeys(page, channel)
                        : FetchAndPush(page, stopToken, channel);
                    if (!delivered)
                    {
                        return;
                    }

                    continuationToken = std::move(page.ContinuationToken);
                } while (continuationToken);
            }

        private:
            static bool PushKeys(const Core::BlobPage& page, Core::ResultChannel& channel)
            {
                for (const auto& blob : page.Blobs)
                {
                    Core::Result result;
                    result.Entry.Key = KeyMapping::ToKey(blob.GetName());
                    result.Entry.Size = blob.GetSize();
                    if (!channel.Push(std::move(result)))
                    {
                        return false;
                    }
                }

                return true;
            }

            bool FetchAndPush(const Core::BlobPage& page, std::stop_token stopToken, Core::ResultChannel& channel) const
            {
                if (page.Blobs.empty())
                {
                    return true;
                }

                std::atomic<size_t> next = 0;
                std::atomic<bool> cancelled = false;
                const auto workerCount = std::min(m_maxConcurrentFetches, page.Blobs.size());

                std::vector<std::jthread> workers;
                workers.reserve(workerCount);
                for (size_t i = 0; i < workerCount; ++i)
                {
                    workers.emplace_back([&]()
                        {
                            for (auto index = next++; index < page.Blobs.size(); index = next++)
                            {
                                if (stopToken.stop_requested() || cancelled)
                                {
                                    return;
                                }

                                const auto& blob = page.Blobs[index];
                                Core::Result result;
                                result.Entry.Key = KeyMapping::ToKey(blob.GetName());
                                result.Entry.Size = blob.GetSize();
                                try
                                {
                                    result.Entry.Value = m_container->GetBlobClient(blob.GetName())->Download(stopToken);
                                }
                                catch (const std::exception& ex)
                                {
                                    BOOST_LOG_SEV(*m_logger, error) << "Fetching '" << blob.GetName() << "' failed: " << ex.what();
                                    result.Error = std::current_exception();
                                }

                                if (!channel.Push(std::move(result)))
                                {
                                    cancelled = true;
                                    return;
                                }
                            }
                        });
                }

                for (auto& worker : workers)
                {
                    worker.join();
                }

                return !cancelled && !stopToken.stop_requested();
            }
        };
    }

    BlobDatastoreImpl::BlobDatastoreImpl(std::shared_ptr<Core::ContainerClient> container,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        size_t maxConcurrentFetches,
        int32_t pageSizeHint,
        size_t resultBufferSize)
        : m_container(std::move(container)),
        m_logger(std::move(logger)),
        m_maxConcurrentFetches(maxConcurrentFetches),
        m_pageSizeHint(pageSizeHint),
        m_resultBufferSize(resultBufferSize)
    {
        if (m_container->CreateIfNotExists())
        {
            BOOST_LOG_SEV(*m_logger, info) << "Created blob container";
        }
    }

    void BlobDatastoreImpl::Put(const std::string& key, std::span<const char> value)
    {
        m_container->GetBlobClient(KeyMapping::ToBlobName(key))->Upload(value);
    }

    std::vector<char> BlobDatastoreImpl::Get(const std::string& key)
    {
        return m_container->GetBlobClient(KeyMapping::ToBlobName(key))->Download(std::stop_token{});
    }

    bool BlobDatastoreImpl::Has(const std::string& key)
    {
        try
        {
            (void)m_container->GetBlobClient(KeyMapping::ToBlobName(key))->GetSize();
            return true;
        }
        catch (const Core::NotFoundError&)
        {
            return false;
        }
    }

    int64_t BlobDatastoreImpl::GetSize(const std::string& key)
    {
        return m_container->GetBlobClient(KeyMapping::ToBlobName(key))->GetSize();
    }

    void BlobDatastoreImpl::Delete(const std::string& key)
    {
        // Deleting an absent key is not an error.
        (void)m_container->GetBlobClient(KeyMapping::ToBlobName(key))->Delete();
    }

    std::unique_ptr<Core::Results> BlobDatastoreImpl::Query(const Core::Query& query)
    {
        PageLister lister(m_container,
            m_logger,
            KeyMapping::ListingPrefix(query),
            query.KeysOnly,
            m_maxConcurrentFetches,
            m_pageSizeHint);

        return Core::NaiveQueryApply(std::make_unique<Core::ChannelResults>(query, m_resultBufferSize, std::move(lister)));
    }
}
