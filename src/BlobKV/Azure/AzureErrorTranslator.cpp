// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Azure/AzureErrorTranslator.hpp"
#include "BlobKV/Core/Errors.hpp"

#include <azure/core/http/http_status_code.hpp>

#include <string_view>
namespace BlobKV::Azure
{
    static const constexpr std::string_view g_blobNotFound = "BlobNotFound";
    static const constexpr std::string_view g_containerAlreadyExists = "ContainerAlreadyExists";

    bool AzureErrorTranslator::IsNotFound(const ::Azure::Core::RequestFailedException& ex) noexcept
    {
        if (ex.ErrorCode == g_blobNotFound)
        {
            return true;
        }

        // Responses to HEAD requests carry no body, the error code may be missing.
        return ex.ErrorCode.empty() && ex.StatusCode == ::Azure::Core::Http::HttpStatusCode::NotFound;
    }

    bool AzureErrorTranslator::IsAlreadyExists(const ::Azure::Core::RequestFailedException& ex) noexcept
    {
        return ex.ErrorCode == g_containerAlreadyExists;
    }

    void AzureErrorTranslator::TranslateAndRethrow(const std::string& key)
    {
        try
        {
            throw;
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            if (IsNotFound(ex))
            {
                throw Core::NotFoundError(key);
            }

            throw;
        }
    }
}
