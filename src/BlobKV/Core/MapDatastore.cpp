// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/MapDatastore.hpp"
namespace BlobKV::Core
{
    void MapDatastore::Put(const std::string& key, std::span<const char> value)
    {
        std::scoped_lock lock(m_mutex);
        m_values.insert_or_assign(key, std::vector<char>(value.begin(), value.end()));
    }

    std::vector<char> MapDatastore::Get(const std::string& key)
    {
        std::scoped_lock lock(m_mutex);
        auto it = m_values.find(key);
        if (it == m_values.end())
        {
            throw NotFoundError(key);
        }

        return it->second;
    }

    bool MapDatastore::Has(const std::string& key)
    {
        std::scoped_lock lock(m_mutex);
        return m_values.contains(key);
    }

    int64_t MapDatastore::GetSize(const std::string& key)
    {
        std::scoped_lock lock(m_mutex);
        auto it = m_values.find(key);
        if (it == m_values.end())
        {
            throw NotFoundError(key);
        }

        return static_cast<int64_t>(it->second.size());
    }

    void MapDatastore::Delete(const std::string& key)
    {
        std::scoped_lock lock(m_mutex);
        m_values.erase(key);
    }

    std::unique_ptr<Results> MapDatastore::Query(const Core::Query& query)
    {
        std::vector<Result> snapshot;
        {
            std::scoped_lock lock(m_mutex);
            snapshot.reserve(m_values.size());
            for (const auto& [key, value] : m_values)
            {
                Result result;
                result.Entry.Key = key;
                result.Entry.Size = static_cast<int64_t>(value.size());
                if (!query.KeysOnly)
                {
                    result.Entry.Value = value;
                }

                snapshot.push_back(std::move(result));
            }
        }

        return NaiveQueryApply(std::make_unique<SliceResults>(query, std::move(snapshot)));
    }

    std::unique_ptr<WriteBatch> MapDatastore::Batch()
    {
        return std::make_unique<BasicBatch>(*this);
    }

    void MapDatastore::Sync(const std::string&)
    {
    }

    void MapDatastore::Close()
    {
    }

    uint64_t MapDatastore::DiskUsage()
    {
        std::scoped_lock lock(m_mutex);
        uint64_t size = 0;
        for (const auto& [key, value] : m_values)
        {
            size += value.size();
        }

        return size;
    }
}
