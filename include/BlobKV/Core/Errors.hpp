// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <stdexcept>
#include <string>
namespace BlobKV::Core
{
    class DatastoreError : public std::runtime_error
    {
    public:
        explicit DatastoreError(const std::string& message);
    };

    /// <summary>
    /// Raised by Get and GetSize when the key has no value. Has and Delete never raise it.
    /// </summary>
    class NotFoundError final : public DatastoreError
    {
        std::string m_key;

    public:
        explicit NotFoundError(std::string key);
        [[nodiscard]] const std::string& GetKey() const noexcept;
    };

    class UnsupportedError final : public DatastoreError
    {
    public:
        explicit UnsupportedError(const std::string& operation);
    };
}
