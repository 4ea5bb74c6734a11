// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/Query.hpp"

#include <memory>
#include <optional>
#include <vector>
namespace BlobKV::Core
{
    /// <summary>
    /// A lazy stream of query results. Consumed by a single caller.
    /// </summary>
    class Results
    {
    public:
        virtual ~Results() = default;

        [[nodiscard]] virtual const Core::Query& GetQuery() const noexcept = 0;

        /// <summary>
        /// Blocks until the next result is available.
        /// </summary>
        /// <returns>The next result or std::nullopt once the stream is exhausted or closed.</returns>
        [[nodiscard]] virtual std::optional<Result> Next() = 0;

        /// <summary>
        /// Releases the producer side of the stream. Safe to call more than once.
        /// </summary>
        virtual void Close() = 0;

        /// <summary>
        /// Drains the stream. Rethrows the first errored result after closing the stream.
        /// </summary>
        std::vector<Entry> Rest();
    };

    class SliceResults final : public Results
    {
        Core::Query m_query;
        std::vector<Result> m_results;
        size_t m_position;

    public:
        SliceResults(Core::Query query, std::vector<Result> results);

        [[nodiscard]] virtual const Core::Query& GetQuery() const noexcept override;
        [[nodiscard]] virtual std::optional<Result> Next() override;
        virtual void Close() override;
    };

    /// <summary>
    /// Applies the source's query on the client side: prefix, filters, orders, offset and limit, in that order.
    /// Errored results skip filtering and ordering and are passed through.
    /// </summary>
    [[nodiscard]] std::unique_ptr<Results> NaiveQueryApply(std::unique_ptr<Results> source);
}
