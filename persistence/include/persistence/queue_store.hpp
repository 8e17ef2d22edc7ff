#pragma once

#include <shared_data/transfer/queue_record.hpp>
#include <utility/describe.hpp>
#include <ids/ids.hpp>

#include <fmt/format.h>

#include <expected>
#include <string>
#include <vector>

namespace Persistence
{
    BOOST_DEFINE_ENUM_CLASS(StoreErrorType, OpenFailed, ReadFailed, WriteFailed, CompactionFailed, NotOpen)

    struct StoreError
    {
        StoreErrorType type{StoreErrorType::NotOpen};
        std::string message{};

        std::string toString() const
        {
            return fmt::format("{}: {}", boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE"), message);
        }
    };

    /**
     * @brief Durable mirror of the transfer queue. Writes of several records are not atomic as a whole.
     */
    class IQueueStore
    {
      public:
        virtual ~IQueueStore() = default;

        virtual std::expected<void, StoreError> put(SharedData::QueueRecord const& record) = 0;
        virtual std::expected<void, StoreError> putMany(std::vector<SharedData::QueueRecord> const& records) = 0;
        /**
         * @brief All live records ordered by their enqueue sequence. Empty on first run.
         */
        virtual std::expected<std::vector<SharedData::QueueRecord>, StoreError> getAll() = 0;
        virtual std::expected<void, StoreError> remove(Ids::ItemId const& id) = 0;
        virtual std::expected<void, StoreError> removeMany(std::vector<Ids::ItemId> const& ids) = 0;
        virtual std::expected<void, StoreError> clear() = 0;
    };
}
