#include "BlobKV/Azure/Impl/KeyMapping.hpp"
namespace BlobKV::Azure::Impl
{
    std::string KeyMapping::ToBlobName(const std::string& key)
    {
        return key;
    }

    std::string KeyMapping::ToKey(const std::string& blobName)
    {
        return blobName;
    }

    std::string KeyMapping::ListingPrefix(const Core::Query& query)
    {
        return ToBlobName(query.NormalizedPrefix());
    }
}
