// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <span>
#include <stop_token>
#include <vector>
namespace BlobKV::Core
{
    class BlobClient
    {
    public:
        virtual ~BlobClient() = default;

        /// <summary>
        /// Uploads the buffer as the blob's entire content in a single request, replacing any existing content.
        /// </summary>
        /// <param name="content">The bytes to store.</param>
        virtual void Upload(std::span<const char> content) = 0;

        /// <summary>
        /// Downloads the blob's entire content.
        /// </summary>
        /// <param name="stopToken">Cancels the request when stop is requested.</param>
        /// <returns>The blob content.</returns>
        /// <exception cref="NotFoundError">The blob does not exist.</exception>
        virtual std::vector<char> Download(std::stop_token stopToken) = 0;

        /// <summary>
        /// Returns the content length of the blob without fetching its content.
        /// </summary>
        /// <returns>The size of the blob.</returns>
        /// <exception cref="NotFoundError">The blob does not exist.</exception>
        virtual int64_t GetSize() = 0;

        /// <summary>
        /// Deletes the blob together with its snapshots.
        /// </summary>
        /// <returns>false if there was no blob to delete.</returns>
        virtual bool Delete() = 0;
    };
}
