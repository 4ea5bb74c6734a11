// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/Batch.hpp"
#include "BlobKV/Core/Datastore.hpp"
namespace BlobKV::Core
{
    BasicBatch::BasicBatch(Datastore& datastore)
        : m_datastore(datastore)
    {
    }

    void BasicBatch::Put(const std::string& key, std::span<const char> value)
    {
        m_operations.push_back(Operation{ OperationType::Put, key, std::vector<char>(value.begin(), value.end()) });
    }

    void BasicBatch::Delete(const std::string& key)
    {
        m_operations.push_back(Operation{ OperationType::Delete, key, {} });
    }

    void BasicBatch::Commit()
    {
        auto it = m_operations.begin();
        try
        {
            for (; it != m_operations.end(); ++it)
            {
                if (it->Type == OperationType::Put)
                {
                    m_datastore.Put(it->Key, it->Value);
                }
                else
                {
                    m_datastore.Delete(it->Key);
                }
            }
        }
        catch (...)
        {
            m_operations.erase(m_operations.begin(), it);
            throw;
        }

        m_operations.clear();
    }

    size_t BasicBatch::Size() const noexcept
    {
        return m_operations.size();
    }
}
