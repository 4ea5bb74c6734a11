// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace BlobKV::Azure::Impl
{
    struct Configuration
    {
        struct Query
        {
            static const constexpr size_t MaxConcurrentFetches = 16;
            static const constexpr int32_t ListPageSizeHint = 5000; // service maximum
            static const constexpr size_t ResultBufferSize = 256;
        };

        static const constexpr std::string_view BlobEndpointSuffix = "blob.core.windows.net";
        static const constexpr int MaxClientRetries = 8;
    };
}
