#pragma once

#include <transfer/backend_api.hpp>

#include <gmock/gmock.h>

namespace Transfer::Test
{
    class BackendApiMock : public IBackendApi
    {
      public:
        MOCK_METHOD(
            (std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>),
            negotiateDestinations,
            (std::vector<SharedData::DestinationRequest> const& requests),
            (override));
        MOCK_METHOD(
            (std::expected<void, BackendError>),
            commitCompletion,
            (std::vector<Ids::FileId> const& fileIds),
            (override));
        MOCK_METHOD(
            (std::expected<SharedData::BulkDeleteResult, BackendError>),
            bulkDelete,
            (std::vector<Ids::FileId> const& fileIds),
            (override));
    };
}
