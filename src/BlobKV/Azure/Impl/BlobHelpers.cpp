// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/Impl/BlobHelpers.hpp"
#include "BlobKV/Azure/Impl/Configuration.hpp"

#include <azure/storage/common/storage_credential.hpp>

#include <memory>
namespace BlobKV::Azure::Impl
{
    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions()
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Identity::ClientSecretCredentialOptions BlobHelpers::CreateClientSecretCredentialOptions()
    {
        auto opts = ::Azure::Identity::ClientSecretCredentialOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const Models::SharedKeyStorageInfo& sharedKey)
    {
        auto cred = std::make_shared<::Azure::Storage::StorageSharedKeyCredential>(sharedKey.GetAccountName(),
            sharedKey.GetAccountKey());

        auto blobOptions = CreateBlobClientOptions();
        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            sharedKey.GetStorageAccountUrl(),
            std::move(cred),
            blobOptions
        };
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const Models::ServicePrincipalStorageInfo& servicePrincipal)
    {
        auto clientSecretOptions = CreateClientSecretCredentialOptions();
        auto cred = std::make_shared<::Azure::Identity::ClientSecretCredential>(servicePrincipal.GetTenantId(),
            servicePrincipal.GetServicePrincipalId(),
            servicePrincipal.GetServicePrincipalSecret(),
            clientSecretOptions);

        auto blobOptions = CreateBlobClientOptions();
        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            servicePrincipal.GetStorageAccountUrl(),
            std::move(cred),
            blobOptions
        };
    }

    ::Azure::Storage::Blobs::BlobContainerClient BlobHelpers::GetContainerClient(const ::Azure::Storage::Blobs::BlobServiceClient& blobServiceClient, const std::string& name)
    {
        return blobServiceClient.GetBlobContainerClient(name);
    }
}
