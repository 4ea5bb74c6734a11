// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/Impl/BlockBlob.hpp"
#include "BlobKV/Azure/AzureErrorTranslator.hpp"

#include <azure/core/context.hpp>
#include <azure/core/io/body_stream.hpp>
namespace BlobKV::Azure::Impl
{
    BlockBlob::BlockBlob(::Azure::Storage::Blobs::BlockBlobClient client, std::string name)
        : m_client(std::move(client)), m_name(std::move(name))
    {
    }

    void BlockBlob::Upload(std::span<const char> content)
    {
        ::Azure::Core::IO::MemoryBodyStream dataStream(reinterpret_cast<const uint8_t*>(content.data()), content.size());
        m_client.Upload(dataStream);
    }

    std::vector<char> BlockBlob::Download(std::stop_token stopToken)
    {
        ::Azure::Core::Context context;
        std::stop_callback cancelOnStop(stopToken, [&context]()
            {
                context.Cancel();
            });

        try
        {
            auto result = m_client.Download({}, context);
            const auto body = result.Value.BodyStream->ReadToEnd(context);
            return std::vector<char>(body.begin(), body.end());
        }
        catch (const ::Azure::Core::RequestFailedException&)
        {
            AzureErrorTranslator::TranslateAndRethrow(m_name);
        }
    }

    int64_t BlockBlob::GetSize()
    {
        try
        {
            const auto props = m_client.GetProperties();
            return props.Value.BlobSize;
        }
        catch (const ::Azure::Core::RequestFailedException&)
        {
            AzureErrorTranslator::TranslateAndRethrow(m_name);
        }
    }

    bool BlockBlob::Delete()
    {
        ::Azure::Storage::Blobs::DeleteBlobOptions options;
        options.DeleteSnapshots = ::Azure::Storage::Blobs::Models::DeleteSnapshotsOption::IncludeSnapshots;
        try
        {
            m_client.Delete(options);
            return true;
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            if (AzureErrorTranslator::IsNotFound(ex))
            {
                return false;
            }

            throw;
        }
    }
}
