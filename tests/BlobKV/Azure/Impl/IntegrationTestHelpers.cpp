// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "IntegrationTestHelpers.hpp"
#include "BlobKV/Azure/Impl/Configuration.hpp"

#include <azure/core/http/http_status_code.hpp>
#include <boost/log/trivial.hpp>

#include <cstdlib>
#include <random>
using namespace boost::log::trivial;

namespace BlobKV::Azure::Impl::Testing
{
    static std::string ContainerFromEnvironment()
    {
        const char* container = std::getenv("AZURE_TEST_CONTAINER");
        return container ? container : "blobkv-integration-tests";
    }

    std::optional<Models::SharedKeyStorageInfo> LoadSharedKeyFromEnvironment()
    {
        const char* storageAccountName = std::getenv("AZURE_STORAGE_ACCOUNT_NAME");
        const char* storageAccountKey = std::getenv("AZURE_STORAGE_ACCOUNT_KEY");
        const char* storageAccountUrl = std::getenv("AZURE_STORAGE_ACCOUNT_URL");
        if (!storageAccountName || !storageAccountKey)
        {
            return std::nullopt;
        }

        if (storageAccountUrl)
        {
            return Models::SharedKeyStorageInfo(ContainerFromEnvironment(), storageAccountName, storageAccountKey, storageAccountUrl);
        }

        return Models::SharedKeyStorageInfo(ContainerFromEnvironment(), storageAccountName, storageAccountKey);
    }

    std::optional<Models::ServicePrincipalStorageInfo> LoadServicePrincipalFromEnvironment()
    {
        const char* spId = std::getenv("AZURE_SERVICE_PRINCIPAL_ID");
        const char* spSecret = std::getenv("AZURE_SERVICE_PRINCIPAL_SECRET");
        const char* tenant = std::getenv("AZURE_TENANT_ID");
        const char* storageAccountName = std::getenv("AZURE_STORAGE_ACCOUNT_NAME");

        if (!spId || !spSecret || !storageAccountName)
        {
            return std::nullopt;
        }

        std::string tenantId = tenant ? tenant : "";
        std::string storageAccountUrl = "https://" + std::string(storageAccountName) + "." + std::string(Configuration::BlobEndpointSuffix) + "/";
        return Models::ServicePrincipalStorageInfo(
            ContainerFromEnvironment(),
            storageAccountUrl,
            spId,
            spSecret,
            tenantId
        );
    }

    std::string GenerateRandomPrefix(const std::string& prefix)
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        return prefix + "-" + std::to_string(dis(gen)) + "/";
    }

    bool IsAuthenticationError(const std::exception& e)
    {
        std::string errorMsg = e.what();
        return errorMsg.find("invalid_client") != std::string::npos ||
            errorMsg.find("AADSTS") != std::string::npos ||
            errorMsg.find("Unauthorized") != std::string::npos ||
            errorMsg.find("expired") != std::string::npos;
    }

    void AzureIntegrationTestBase::SetUp()
    {
        m_logger = std::make_shared<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>();
        m_prefix = GenerateRandomPrefix();
        Connect();
    }

    void AzureIntegrationTestBase::TearDown()
    {
        CleanupKeys();
    }

    std::string AzureIntegrationTestBase::Key(const std::string& name) const
    {
        return m_prefix + name;
    }

    void AzureIntegrationTestBase::Connect()
    {
        const auto sharedKey = LoadSharedKeyFromEnvironment();
        const auto servicePrincipal = sharedKey ? std::nullopt : LoadServicePrincipalFromEnvironment();
        if (!sharedKey && !servicePrincipal)
        {
            GTEST_SKIP() << "Azure credentials not found in environment variables. "
                << "Set AZURE_STORAGE_ACCOUNT_NAME with AZURE_STORAGE_ACCOUNT_KEY, or with AZURE_SERVICE_PRINCIPAL_ID and AZURE_SERVICE_PRINCIPAL_SECRET, to run integration tests.";
        }

        try
        {
            m_datastore = sharedKey
                ? std::make_unique<BlobDatastore>(*sharedKey, m_logger)
                : std::make_unique<BlobDatastore>(*servicePrincipal, m_logger);
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            HandleAuthenticationError(e);
            GTEST_SKIP() << "Failed to connect to Azure: " << e.what();
        }
        catch (const std::exception& e)
        {
            if (IsAuthenticationError(e))
            {
                GTEST_SKIP() << "Azure authentication failed: " << e.what()
                    << ". Please check your credentials are valid and not expired.";
            }
            GTEST_SKIP() << "Failed to connect to Azure: " << e.what();
        }
    }

    void AzureIntegrationTestBase::HandleAuthenticationError(const ::Azure::Core::RequestFailedException& e)
    {
        if (e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Unauthorized ||
            e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Forbidden)
        {
            GTEST_SKIP() << "Azure authentication failed: " << e.what()
                << ". Please check your credentials are valid and not expired.";
        }
    }

    void AzureIntegrationTestBase::CleanupKeys()
    {
        if (!m_datastore)
        {
            return;
        }

        try
        {
            auto results = m_datastore->Query(Core::Query{ .Prefix = m_prefix, .KeysOnly = true });
            for (const auto& entry : results->Rest())
            {
                m_datastore->Delete(entry.Key);
            }
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Cleanup of '" << m_prefix << "' failed: " << e.what();
        }
    }
}
