#pragma once

#include <persistence/queue_store.hpp>

#include <gmock/gmock.h>

namespace Persistence::Test
{
    class QueueStoreMock : public IQueueStore
    {
      public:
        MOCK_METHOD((std::expected<void, StoreError>), put, (SharedData::QueueRecord const& record), (override));
        MOCK_METHOD(
            (std::expected<void, StoreError>),
            putMany,
            (std::vector<SharedData::QueueRecord> const& records),
            (override));
        MOCK_METHOD((std::expected<std::vector<SharedData::QueueRecord>, StoreError>), getAll, (), (override));
        MOCK_METHOD((std::expected<void, StoreError>), remove, (Ids::ItemId const& id), (override));
        MOCK_METHOD((std::expected<void, StoreError>), removeMany, (std::vector<Ids::ItemId> const& ids), (override));
        MOCK_METHOD((std::expected<void, StoreError>), clear, (), (override));
    };
}
