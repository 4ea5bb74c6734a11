#pragma once
#include <string>
namespace BlobKV::Azure::Models
{
    class ServicePrincipalStorageInfo
    {
        std::string m_containerName;
        std::string m_storageAccountUrl;
        std::string m_servicePrincipalId;
        std::string m_servicePrincipalSecret;
        std::string m_tenantId;
    public:
        ServicePrincipalStorageInfo(const std::string& containerName,
            const std::string& storageAccountUrl,
            const std::string& servicePrincipalId,
            const std::string& servicePrincipalSecret,
            const std::string& tenantId);

        const std::string& GetContainerName() const noexcept;
        const std::string& GetStorageAccountUrl() const noexcept;
        const std::string& GetServicePrincipalId() const noexcept;
        const std::string& GetServicePrincipalSecret() const noexcept;
        const std::string& GetTenantId() const noexcept;
    };
}
