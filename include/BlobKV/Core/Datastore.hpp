// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/Batch.hpp"
#include "BlobKV/Core/Errors.hpp"
#include "BlobKV/Core/Results.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace BlobKV::Core
{
    /// <summary>
    /// Generic key/value datastore. Keys are opaque and compared byte-for-byte.
    /// </summary>
    class Datastore
    {
    public:
        virtual ~Datastore() = default;

        /// <summary>
        /// Stores the value, replacing any previous value for the key.
        /// </summary>
        virtual void Put(const std::string& key, std::span<const char> value) = 0;

        /// <exception cref="NotFoundError">The key has no value.</exception>
        [[nodiscard]] virtual std::vector<char> Get(const std::string& key) = 0;

        [[nodiscard]] virtual bool Has(const std::string& key) = 0;

        /// <exception cref="NotFoundError">The key has no value.</exception>
        [[nodiscard]] virtual int64_t GetSize(const std::string& key) = 0;

        /// <summary>
        /// Removes the key. Removing an absent key succeeds.
        /// </summary>
        virtual void Delete(const std::string& key) = 0;

        [[nodiscard]] virtual std::unique_ptr<Results> Query(const Core::Query& query) = 0;
        [[nodiscard]] virtual std::unique_ptr<WriteBatch> Batch() = 0;

        /// <summary>
        /// Makes previous writes under the prefix durable.
        /// </summary>
        virtual void Sync(const std::string& prefix) = 0;
        virtual void Close() = 0;

        /// <exception cref="UnsupportedError">The backend cannot report its usage.</exception>
        [[nodiscard]] virtual uint64_t DiskUsage() = 0;
    };
}
