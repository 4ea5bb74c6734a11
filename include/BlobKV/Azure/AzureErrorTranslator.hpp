// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <azure/core/exception.hpp>

#include <string>
namespace BlobKV::Azure
{
    /// <summary>
    /// The only place that knows Azure error codes. Everything that is not recognized stays opaque
    /// and reaches the caller as the original exception.
    /// </summary>
    struct AzureErrorTranslator
    {
        [[nodiscard]] static bool IsNotFound(const ::Azure::Core::RequestFailedException& ex) noexcept;
        [[nodiscard]] static bool IsAlreadyExists(const ::Azure::Core::RequestFailedException& ex) noexcept;

        /// <summary>
        /// Rethrows the exception currently being handled, replacing a blob-not-found error with
        /// Core::NotFoundError for the key. Must be called from within a catch block.
        /// </summary>
        [[noreturn]] static void TranslateAndRethrow(const std::string& key);
    };
}
