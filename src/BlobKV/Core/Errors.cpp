// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/Errors.hpp"
namespace BlobKV::Core
{
    DatastoreError::DatastoreError(const std::string& message)
        : std::runtime_error(message)
    {
    }

    NotFoundError::NotFoundError(std::string key)
        : DatastoreError("datastore: key not found '" + key + "'"),
        m_key(std::move(key))
    {
    }

    const std::string& NotFoundError::GetKey() const noexcept
    {
        return m_key;
    }

    UnsupportedError::UnsupportedError(const std::string& operation)
        : DatastoreError("datastore: " + operation + " is not supported")
    {
    }
}
