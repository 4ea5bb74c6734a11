#pragma once
#include "BlobKV/Core/Query.hpp"

#include <string>
namespace BlobKV::Azure::Impl
{
    /// <summary>
    /// Keys are used verbatim as blob names. No escaping, case folding or path normalization is applied,
    /// so keys that are not valid blob names are rejected by the service.
    /// </summary>
    struct KeyMapping
    {
        [[nodiscard]] static std::string ToBlobName(const std::string& key);
        [[nodiscard]] static std::string ToKey(const std::string& blobName);

        /// <summary>
        /// The blob name prefix to list for a query. Empty lists the whole container.
        /// </summary>
        [[nodiscard]] static std::string ListingPrefix(const Core::Query& query);
    };
}
