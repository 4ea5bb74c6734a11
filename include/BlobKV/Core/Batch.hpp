// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <span>
#include <string>
#include <vector>
namespace BlobKV::Core
{
    class Datastore;

    class WriteBatch
    {
    public:
        virtual ~WriteBatch() = default;

        virtual void Put(const std::string& key, std::span<const char> value) = 0;
        virtual void Delete(const std::string& key) = 0;

        /// <summary>
        /// Applies the queued operations. No atomicity is implied.
        /// </summary>
        virtual void Commit() = 0;
    };

    /// <summary>
    /// Queues operations and forwards them to the datastore in the order they were queued.
    /// Commit stops at the first failing operation and rethrows its error; operations that were
    /// applied are dropped from the queue, the failing one and everything after it stay queued.
    /// </summary>
    class BasicBatch final : public WriteBatch
    {
        enum class OperationType
        {
            Put,
            Delete
        };

        struct Operation
        {
            OperationType Type;
            std::string Key;
            std::vector<char> Value;
        };

        Datastore& m_datastore;
        std::vector<Operation> m_operations;

    public:
        explicit BasicBatch(Datastore& datastore);

        virtual void Put(const std::string& key, std::span<const char> value) override;
        virtual void Delete(const std::string& key) override;
        virtual void Commit() override;
        [[nodiscard]] size_t Size() const noexcept;
    };
}
