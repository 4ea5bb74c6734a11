// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/Query.hpp"
namespace BlobKV::Core
{
    static int CompareBytes(std::string_view lhs, std::string_view rhs) noexcept
    {
        // char_traits<char> compares as unsigned char, like memcmp.
        const auto result = lhs.compare(rhs);
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }

    static std::string_view AsView(const std::vector<char>& bytes) noexcept
    {
        return { bytes.data(), bytes.size() };
    }

    static std::string_view ValueView(const Entry& entry) noexcept
    {
        return entry.Value ? AsView(*entry.Value) : std::string_view{};
    }

    static bool Evaluate(const CompareOp op, const int comparison) noexcept
    {
        switch (op)
        {
        case CompareOp::Equal:
            return comparison == 0;
        case CompareOp::NotEqual:
            return comparison != 0;
        case CompareOp::GreaterThan:
            return comparison > 0;
        case CompareOp::GreaterThanOrEqual:
            return comparison >= 0;
        case CompareOp::LessThan:
            return comparison < 0;
        case CompareOp::LessThanOrEqual:
            return comparison <= 0;
        default:
            return false;
        }
    }

    FilterKeyCompare::FilterKeyCompare(const CompareOp op, std::string key)
        : m_op(op), m_key(std::move(key))
    {
    }

    bool FilterKeyCompare::Matches(const Entry& entry) const
    {
        return Evaluate(m_op, CompareBytes(entry.Key, m_key));
    }

    FilterValueCompare::FilterValueCompare(const CompareOp op, std::vector<char> value)
        : m_op(op), m_value(std::move(value))
    {
    }

    bool FilterValueCompare::Matches(const Entry& entry) const
    {
        if (!entry.Value)
        {
            return false;
        }

        return Evaluate(m_op, CompareBytes(AsView(*entry.Value), AsView(m_value)));
    }

    FilterKeyPrefix::FilterKeyPrefix(std::string prefix)
        : m_prefix(std::move(prefix))
    {
    }

    bool FilterKeyPrefix::Matches(const Entry& entry) const
    {
        return entry.Key.starts_with(m_prefix);
    }

    int OrderByKey::Compare(const Entry& lhs, const Entry& rhs) const
    {
        return CompareBytes(lhs.Key, rhs.Key);
    }

    int OrderByKeyDescending::Compare(const Entry& lhs, const Entry& rhs) const
    {
        return -CompareBytes(lhs.Key, rhs.Key);
    }

    int OrderByValue::Compare(const Entry& lhs, const Entry& rhs) const
    {
        return CompareBytes(ValueView(lhs), ValueView(rhs));
    }

    int OrderByValueDescending::Compare(const Entry& lhs, const Entry& rhs) const
    {
        return -CompareBytes(ValueView(lhs), ValueView(rhs));
    }

    std::string Query::NormalizedPrefix() const
    {
        if (Prefix.empty() || Prefix == "/")
        {
            return "";
        }

        return Prefix.ends_with('/') ? Prefix : Prefix + '/';
    }

    bool Less(const std::vector<std::shared_ptr<const Order>>& orders, const Entry& lhs, const Entry& rhs)
    {
        for (const auto& order : orders)
        {
            const auto comparison = order->Compare(lhs, rhs);
            if (comparison != 0)
            {
                return comparison < 0;
            }
        }

        return CompareBytes(lhs.Key, rhs.Key) < 0;
    }
}
