// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/Results.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
namespace BlobKV::Core
{
    namespace
    {
        class NaiveResults final : public Results
        {
            std::unique_ptr<Results> m_source;
            std::string m_prefix;
            std::deque<Result> m_sorted;
            bool m_sortedReady = false;
            size_t m_skipped = 0;
            size_t m_returned = 0;

        public:
            explicit NaiveResults(std::unique_ptr<Results> source)
                : m_source(std::move(source)), m_prefix(m_source->GetQuery().NormalizedPrefix())
            {
            }

            const Core::Query& GetQuery() const noexcept override
            {
                return m_source->GetQuery();
            }

            std::optional<Result> Next() override
            {
                const auto& query = GetQuery();
                while (query.Limit == 0 || m_returned < query.Limit)
                {
                    auto result = NextOrdered();
                    if (!result || result->Error)
                    {
                        return result;
                    }

                    if (m_skipped < query.Offset)
                    {
                        m_skipped++;
                        continue;
                    }

                    m_returned++;
                    return result;
                }

                return std::nullopt;
            }

            void Close() override
            {
                m_source->Close();
            }

        private:
            bool Matches(const Entry& entry) const
            {
                if (!entry.Key.starts_with(m_prefix))
                {
                    return false;
                }

                const auto& filters = GetQuery().Filters;
                return std::all_of(filters.begin(), filters.end(), [&entry](const auto& filter)
                    {
                        return filter->Matches(entry);
                    });
            }

            std::optional<Result> NextFiltered()
            {
                while (auto result = m_source->Next())
                {
                    if (result->Error || Matches(result->Entry))
                    {
                        return result;
                    }
                }

                return std::nullopt;
            }

            std::optional<Result> NextOrdered()
            {
                const auto& orders = GetQuery().Orders;
                if (orders.empty())
                {
                    return NextFiltered();
                }

                if (!m_sortedReady)
                {
                    std::vector<Result> entries;
                    while (auto result = NextFiltered())
                    {
                        if (result->Error)
                        {
                            m_sorted.push_back(std::move(*result));
                        }
                        else
                        {
                            entries.push_back(std::move(*result));
                        }
                    }

                    std::stable_sort(entries.begin(), entries.end(), [&orders](const Result& lhs, const Result& rhs)
                        {
                            return Less(orders, lhs.Entry, rhs.Entry);
                        });
                    std::move(entries.begin(), entries.end(), std::back_inserter(m_sorted));
                    m_sortedReady = true;
                }

                if (m_sorted.empty())
                {
                    return std::nullopt;
                }

                auto result = std::move(m_sorted.front());
                m_sorted.pop_front();
                return result;
            }
        };
    }

    std::vector<Entry> Results::Rest()
    {
        std::vector<Entry> entries;
        while (auto result = Next())
        {
            if (result->Error)
            {
                Close();
                std::rethrow_exception(result->Error);
            }

            entries.push_back(std::move(result->Entry));
        }

        return entries;
    }

    SliceResults::SliceResults(Core::Query query, std::vector<Result> results)
        : m_query(std::move(query)), m_results(std::move(results)), m_position(0)
    {
    }

    const Core::Query& SliceResults::GetQuery() const noexcept
    {
        return m_query;
    }

    std::optional<Result> SliceResults::Next()
    {
        if (m_position >= m_results.size())
        {
            return std::nullopt;
        }

        return std::move(m_results[m_position++]);
    }

    void SliceResults::Close()
    {
        m_position = m_results.size();
    }

    std::unique_ptr<Results> NaiveQueryApply(std::unique_ptr<Results> source)
    {
        return std::make_unique<NaiveResults>(std::move(source));
    }
}
