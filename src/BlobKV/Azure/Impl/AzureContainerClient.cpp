// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/Impl/AzureContainerClient.hpp"
#include "BlobKV/Azure/Impl/BlockBlob.hpp"
#include "BlobKV/Azure/AzureErrorTranslator.hpp"

#include <azure/core/context.hpp>
namespace BlobKV::Azure::Impl
{
    AzureContainerClient::AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client)
        : m_client(std::move(client))
    {
    }

    bool AzureContainerClient::CreateIfNotExists()
    {
        try
        {
            m_client.Create();
            return true;
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            if (AzureErrorTranslator::IsAlreadyExists(ex))
            {
                return false;
            }

            throw;
        }
    }

    std::unique_ptr<Core::BlobClient> AzureContainerClient::GetBlobClient(const std::string& name)
    {
        return std::make_unique<BlockBlob>(m_client.GetBlockBlobClient(name), name);
    }

    Core::BlobPage AzureContainerClient::ListBlobs(const std::string& prefix,
        const std::optional<std::string>& continuationToken,
        int32_t pageSizeHint,
        std::stop_token stopToken)
    {
        ::Azure::Core::Context context;
        std::stop_callback cancelOnStop(stopToken, [&context]()
            {
                context.Cancel();
            });

        ::Azure::Storage::Blobs::ListBlobsOptions options;
        if (!prefix.empty())
        {
            options.Prefix = prefix;
        }

        if (continuationToken)
        {
            options.ContinuationToken = *continuationToken;
        }

        options.PageSizeHint = pageSizeHint;

        auto blobs = m_client.ListBlobs(options, context);
        Core::BlobPage page;
        page.Blobs.reserve(blobs.Blobs.size());
        for (const auto& blob : blobs.Blobs)
        {
            page.Blobs.emplace_back(blob.BlobSize, blob.Name);
        }

        if (blobs.NextPageToken.HasValue() && !blobs.NextPageToken.Value().empty())
        {
            page.ContinuationToken = blobs.NextPageToken.Value();
        }

        return page;
    }
}
