// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/ContainerClient.hpp"
#include <gmock/gmock.h>

namespace BlobKV::Core::Mocks
{
    class ContainerClientMock : public ContainerClient
    {
    public:
        ContainerClientMock() = default;
        virtual ~ContainerClientMock() = default;

        MOCK_METHOD(bool, CreateIfNotExists, (), (override));
        MOCK_METHOD(std::unique_ptr<BlobClient>, GetBlobClient, (const std::string& name), (override));
        MOCK_METHOD(BlobPage, ListBlobs, (const std::string& prefix,
            const std::optional<std::string>& continuationToken,
            int32_t pageSizeHint,
            std::stop_token stopToken), (override));
    };
}
