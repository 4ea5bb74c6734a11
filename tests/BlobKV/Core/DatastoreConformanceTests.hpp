#pragma once
#include "BlobKV/Core/Datastore.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
namespace BlobKV::Core::Testing
{
    struct DatastoreFactory
    {
        std::string Name;
        std::function<std::unique_ptr<Datastore>()> Create;
    };

    /// <summary>
    /// Behavior every Datastore shares. Instantiate with INSTANTIATE_TEST_SUITE_P in the test file of
    /// the implementation.
    /// </summary>
    class DatastoreConformanceTests : public ::testing::TestWithParam<DatastoreFactory>
    {
    protected:
        std::unique_ptr<Datastore> m_datastore;

        void SetUp() override
        {
            m_datastore = GetParam().Create();
        }

        static std::vector<char> Bytes(std::string_view text)
        {
            return { text.begin(), text.end() };
        }
    };

    inline std::string FactoryName(const ::testing::TestParamInfo<DatastoreFactory>& info)
    {
        return info.param.Name;
    }
}
