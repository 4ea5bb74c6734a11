// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <string>
namespace BlobKV::Azure::Models
{
    /// <summary>
    /// Storage account name and key. The account URL defaults to the public Azure blob endpoint
    /// and can be given explicitly for emulators and sovereign clouds.
    /// </summary>
    class SharedKeyStorageInfo
    {
        std::string m_containerName;
        std::string m_accountName;
        std::string m_accountKey;
        std::string m_storageAccountUrl;
    public:
        SharedKeyStorageInfo(std::string containerName,
            std::string accountName,
            std::string accountKey);
        SharedKeyStorageInfo(std::string containerName,
            std::string accountName,
            std::string accountKey,
            std::string storageAccountUrl);

        const std::string& GetContainerName() const noexcept;
        const std::string& GetAccountName() const noexcept;
        const std::string& GetAccountKey() const noexcept;
        const std::string& GetStorageAccountUrl() const noexcept;
    };
}
