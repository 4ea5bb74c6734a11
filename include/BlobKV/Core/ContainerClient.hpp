// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/BlobAttributes.hpp"
#include "BlobKV/Core/BlobClient.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
namespace BlobKV::Core
{
    struct BlobPage
    {
        std::vector<BlobAttributes> Blobs;

        // Absent on the last page.
        std::optional<std::string> ContinuationToken;
    };

    class ContainerClient
    {
    public:
        ContainerClient() = default;
        virtual ~ContainerClient() = default;

        /// <summary>
        /// Creates the container. An existing container is not an error.
        /// </summary>
        /// <returns>true if the container was created by this call.</returns>
        virtual bool CreateIfNotExists() = 0;

        virtual std::unique_ptr<BlobClient> GetBlobClient(const std::string& name) = 0;

        /// <summary>
        /// Lists one page of blobs whose names start with the prefix.
        /// </summary>
        /// <param name="prefix">Blob name prefix, empty for the whole container.</param>
        /// <param name="continuationToken">Token returned with the previous page, empty for the first page.</param>
        /// <param name="pageSizeHint">Upper bound on the number of blobs returned.</param>
        /// <param name="stopToken">Cancels the request when stop is requested.</param>
        virtual BlobPage ListBlobs(const std::string& prefix,
            const std::optional<std::string>& continuationToken,
            int32_t pageSizeHint,
            std::stop_token stopToken) = 0;
    };
}
