#pragma once

#include <transfer/object_store.hpp>

#include <gmock/gmock.h>

namespace Transfer::Test
{
    class ObjectStoreMock : public IObjectStore
    {
      public:
        MOCK_METHOD(
            (std::expected<void, SharedData::TransferError>),
            put,
            (SharedData::DestinationDescriptor const& destination,
             IPayload const& payload,
             TransferProgressCallback const& onProgress,
             CancellationSignal const& cancel,
             std::chrono::milliseconds timeout),
            (override));
    };
}
