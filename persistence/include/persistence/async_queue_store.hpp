#pragma once

#include <persistence/queue_store.hpp>
#include <async/processing_thread.hpp>

#include <memory>

namespace Persistence
{
    /**
     * @brief Moves the writes of another store onto a processing thread.
     * Write results are only logged, reads are ordered behind all pending writes.
     */
    class AsyncQueueStore : public IQueueStore
    {
      public:
        explicit AsyncQueueStore(std::shared_ptr<IQueueStore> store);
        ~AsyncQueueStore() override;
        AsyncQueueStore(AsyncQueueStore const&) = delete;
        AsyncQueueStore& operator=(AsyncQueueStore const&) = delete;
        AsyncQueueStore(AsyncQueueStore&&) = delete;
        AsyncQueueStore& operator=(AsyncQueueStore&&) = delete;

        std::expected<void, StoreError> put(SharedData::QueueRecord const& record) override;
        std::expected<void, StoreError> putMany(std::vector<SharedData::QueueRecord> const& records) override;
        std::expected<std::vector<SharedData::QueueRecord>, StoreError> getAll() override;
        std::expected<void, StoreError> remove(Ids::ItemId const& id) override;
        std::expected<void, StoreError> removeMany(std::vector<Ids::ItemId> const& ids) override;
        std::expected<void, StoreError> clear() override;

        /**
         * @brief Blocks until every write pushed so far has been handed to the wrapped store.
         */
        void flush();

      private:
        std::expected<void, StoreError> enqueueWrite(std::function<std::expected<void, StoreError>()> write);

      private:
        std::shared_ptr<IQueueStore> store_;
        Async::ProcessingThread writer_{};
    };
}
