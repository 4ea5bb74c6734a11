// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace BlobKV::Core
{
    struct Entry
    {
        std::string Key;

        // Empty for keys-only queries.
        std::optional<std::vector<char>> Value;
        int64_t Size = -1;
    };

    struct Result
    {
        Core::Entry Entry;

        // Set when this entry could not be produced. The rest of the stream is unaffected.
        std::exception_ptr Error;
    };

    enum class CompareOp
    {
        Equal,
        NotEqual,
        GreaterThan,
        GreaterThanOrEqual,
        LessThan,
        LessThanOrEqual
    };

    class Filter
    {
    public:
        virtual ~Filter() = default;
        [[nodiscard]] virtual bool Matches(const Entry& entry) const = 0;
    };

    class FilterKeyCompare final : public Filter
    {
        CompareOp m_op;
        std::string m_key;

    public:
        FilterKeyCompare(CompareOp op, std::string key);
        [[nodiscard]] virtual bool Matches(const Entry& entry) const override;
    };

    /// <summary>
    /// Compares entry values byte-wise. Entries without a value never match.
    /// </summary>
    class FilterValueCompare final : public Filter
    {
        CompareOp m_op;
        std::vector<char> m_value;

    public:
        FilterValueCompare(CompareOp op, std::vector<char> value);
        [[nodiscard]] virtual bool Matches(const Entry& entry) const override;
    };

    class FilterKeyPrefix final : public Filter
    {
        std::string m_prefix;

    public:
        explicit FilterKeyPrefix(std::string prefix);
        [[nodiscard]] virtual bool Matches(const Entry& entry) const override;
    };

    class Order
    {
    public:
        virtual ~Order() = default;

        /// <returns>Negative if lhs sorts first, positive if rhs sorts first, zero if undecided.</returns>
        [[nodiscard]] virtual int Compare(const Entry& lhs, const Entry& rhs) const = 0;
    };

    class OrderByKey final : public Order
    {
    public:
        [[nodiscard]] virtual int Compare(const Entry& lhs, const Entry& rhs) const override;
    };

    class OrderByKeyDescending final : public Order
    {
    public:
        [[nodiscard]] virtual int Compare(const Entry& lhs, const Entry& rhs) const override;
    };

    class OrderByValue final : public Order
    {
    public:
        [[nodiscard]] virtual int Compare(const Entry& lhs, const Entry& rhs) const override;
    };

    class OrderByValueDescending final : public Order
    {
    public:
        [[nodiscard]] virtual int Compare(const Entry& lhs, const Entry& rhs) const override;
    };

    struct Query
    {
        std::string Prefix;
        std::vector<std::shared_ptr<const Filter>> Filters;
        std::vector<std::shared_ptr<const Order>> Orders;

        // Zero means unlimited.
        size_t Limit = 0;
        size_t Offset = 0;
        bool KeysOnly = false;

        /// <summary>
        /// The prefix as matched against keys: a trailing '/' is appended when missing so that
        /// "/a" selects "/a/b" but not "/ab". Empty and "/" select everything and yield "".
        /// </summary>
        [[nodiscard]] std::string NormalizedPrefix() const;
    };

    /// <summary>
    /// Strict ordering by each order in turn, falling back to ascending key order on ties.
    /// </summary>
    [[nodiscard]] bool Less(const std::vector<std::shared_ptr<const Order>>& orders, const Entry& lhs, const Entry& rhs);
}
