// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/BlobClient.hpp"

#include <azure/storage/blobs/block_blob_client.hpp>

#include <string>
namespace BlobKV::Azure::Impl
{
    class BlockBlob final : public Core::BlobClient
    {
        ::Azure::Storage::Blobs::BlockBlobClient m_client;
        std::string m_name;

    public:
        BlockBlob(::Azure::Storage::Blobs::BlockBlobClient client, std::string name);
        virtual void Upload(std::span<const char> content) override;
        virtual std::vector<char> Download(std::stop_token stopToken) override;
        virtual int64_t GetSize() override;
        virtual bool Delete() override;
    };
}
