// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/Models/SharedKeyStorageInfo.hpp"
#include "BlobKV/Azure/Impl/Configuration.hpp"
namespace BlobKV::Azure::Models
{
    SharedKeyStorageInfo::SharedKeyStorageInfo(std::string containerName,
        std::string accountName,
        std::string accountKey)
        : m_containerName(std::move(containerName)),
        m_accountName(std::move(accountName)),
        m_accountKey(std::move(accountKey)),
        m_storageAccountUrl("https://" + m_accountName + "." + std::string(Impl::Configuration::BlobEndpointSuffix))
    {
    }

    SharedKeyStorageInfo::SharedKeyStorageInfo(std::string containerName,
        std::string accountName,
        std::string accountKey,
        std::string storageAccountUrl)
        : m_containerName(std::move(containerName)),
        m_accountName(std::move(accountName)),
        m_accountKey(std::move(accountKey)),
        m_storageAccountUrl(std::move(storageAccountUrl))
    {
    }

    const std::string& SharedKeyStorageInfo::GetContainerName() const noexcept
    {
        return m_containerName;
    }

    const std::string& SharedKeyStorageInfo::GetAccountName() const noexcept
    {
        return m_accountName;
    }

    const std::string& SharedKeyStorageInfo::GetAccountKey() const noexcept
    {
        return m_accountKey;
    }

    const std::string& SharedKeyStorageInfo::GetStorageAccountUrl() const noexcept
    {
        return m_storageAccountUrl;
    }
}
