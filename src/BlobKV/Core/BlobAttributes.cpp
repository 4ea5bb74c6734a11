#include "BlobKV/Core/BlobAttributes.hpp"
namespace BlobKV::Core
{
    BlobAttributes::BlobAttributes(const int64_t size, std::string name)
        : m_size(size), m_name(std::move(name))
    {
    }

    int64_t BlobAttributes::GetSize() const noexcept
    {
        return m_size;
    }

    const std::string& BlobAttributes::GetName() const noexcept
    {
        return m_name;
    }
}
