#pragma once
#include "BlobKV/Core/ContainerClient.hpp"

#include <azure/storage/blobs.hpp>
namespace BlobKV::Azure::Impl
{
    class AzureContainerClient final : public Core::ContainerClient
    {
        ::Azure::Storage::Blobs::BlobContainerClient m_client;

    public:
        AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client);
        virtual bool CreateIfNotExists() override;
        virtual std::unique_ptr<Core::BlobClient> GetBlobClient(const std::string& name) override;
        virtual Core::BlobPage ListBlobs(const std::string& prefix,
            const std::optional<std::string>& continuationToken,
            int32_t pageSizeHint,
            std::stop_token stopToken) override;
    };
}
