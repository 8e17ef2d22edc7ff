#include <persistence/async_queue_store.hpp>
#include <log/log.hpp>

namespace Persistence
{
    AsyncQueueStore::AsyncQueueStore(std::shared_ptr<IQueueStore> store)
        : store_{std::move(store)}
    {
        writer_.start(std::chrono::milliseconds{100});
    }

    AsyncQueueStore::~AsyncQueueStore()
    {
        writer_.stop();
    }

    std::expected<void, StoreError>
    AsyncQueueStore::enqueueWrite(std::function<std::expected<void, StoreError>()> write)
    {
        const bool pushed = writer_.pushTask([write = std::move(write)]() {
            if (auto result = write(); !result)
                Log::error("AsyncQueueStore: Write failed: {}", result.error().toString());
        });
        if (!pushed)
            return std::unexpected(StoreError{.type = StoreErrorType::NotOpen, .message = "Writer is shutting down."});
        return {};
    }

    std::expected<void, StoreError> AsyncQueueStore::put(SharedData::QueueRecord const& record)
    {
        return enqueueWrite([store = store_, record]() {
            return store->put(record);
        });
    }

    std::expected<void, StoreError> AsyncQueueStore::putMany(std::vector<SharedData::QueueRecord> const& records)
    {
        return enqueueWrite([store = store_, records]() {
            return store->putMany(records);
        });
    }

    std::expected<std::vector<SharedData::QueueRecord>, StoreError> AsyncQueueStore::getAll()
    {
        try
        {
            return writer_
                .pushPromiseTask([store = store_]() {
                    return store->getAll();
                })
                .get();
        }
        catch (std::exception const& e)
        {
            return std::unexpected(StoreError{.type = StoreErrorType::ReadFailed, .message = e.what()});
        }
    }

    std::expected<void, StoreError> AsyncQueueStore::remove(Ids::ItemId const& id)
    {
        return enqueueWrite([store = store_, id]() {
            return store->remove(id);
        });
    }

    std::expected<void, StoreError> AsyncQueueStore::removeMany(std::vector<Ids::ItemId> const& ids)
    {
        return enqueueWrite([store = store_, ids]() {
            return store->removeMany(ids);
        });
    }

    std::expected<void, StoreError> AsyncQueueStore::clear()
    {
        return enqueueWrite([store = store_]() {
            return store->clear();
        });
    }

    void AsyncQueueStore::flush()
    {
        try
        {
            writer_.pushPromiseTask([]() {}).get();
        }
        catch (std::exception const& e)
        {
            Log::warn("AsyncQueueStore: Flush did not complete: {}", e.what());
        }
    }
}
