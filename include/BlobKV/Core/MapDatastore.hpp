// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/Datastore.hpp"

#include <map>
#include <mutex>
namespace BlobKV::Core
{
    /// <summary>
    /// In-memory datastore. Reference behavior for the Datastore contract.
    /// </summary>
    class MapDatastore final : public Datastore
    {
        std::mutex m_mutex;
        std::map<std::string, std::vector<char>> m_values;

    public:
        virtual void Put(const std::string& key, std::span<const char> value) override;
        [[nodiscard]] virtual std::vector<char> Get(const std::string& key) override;
        [[nodiscard]] virtual bool Has(const std::string& key) override;
        [[nodiscard]] virtual int64_t GetSize(const std::string& key) override;
        virtual void Delete(const std::string& key) override;
        [[nodiscard]] virtual std::unique_ptr<Results> Query(const Core::Query& query) override;
        [[nodiscard]] virtual std::unique_ptr<WriteBatch> Batch() override;
        virtual void Sync(const std::string& prefix) override;
        virtual void Close() override;

        // Sum of the stored value sizes.
        [[nodiscard]] virtual uint64_t DiskUsage() override;
    };
}
