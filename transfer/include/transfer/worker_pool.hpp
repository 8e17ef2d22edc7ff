#pragma once

#include <transfer/transfer_job.hpp>
#include <async/processing_thread.hpp>
#include <async/processing_strand.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Transfer
{
    struct RunShard
    {
        std::vector<QueueItem> items{};
        std::optional<EncryptionContext> encryption{std::nullopt};
        /// One per item, filled in by the pool.
        std::vector<CancellationSignal> signals{};
    };

    /**
     * @brief How many transfers of a shard run at the same time. Large files get fewer parallel transfers,
     * never more than the shard has items.
     */
    std::size_t shardConcurrency(std::vector<QueueItem> const& items);

    struct ItemProgress
    {
        Ids::ItemId id{};
        int percent{0};
    };

    struct ItemFinished
    {
        JobOutcome outcome{};
    };

    struct ShardFinished
    {
        Ids::WorkerId worker{};
        std::size_t itemCount{0};
    };

    using WorkerMessage = std::variant<ItemProgress, ItemFinished, ShardFinished>;

    /**
     * @brief Isolated workers for shard uploads. Every worker owns its own processing thread and talks to the
     * orchestrator only through messages. All public methods must be called on the orchestrator thread.
     */
    class WorkerPool
    {
      public:
        struct Options
        {
            std::size_t workerCount{4};
            std::chrono::milliseconds cancelGracePeriod{100};
            TransferJob::Options job{};
        };

        using MessageHandler = std::function<void(WorkerMessage const&)>;

        WorkerPool(
            Async::ProcessingThread& orchestrator,
            std::shared_ptr<NegotiationClient> negotiation,
            std::shared_ptr<IObjectStore> objectStore,
            Options options,
            MessageHandler onMessage);
        ~WorkerPool();
        WorkerPool(WorkerPool const&) = delete;
        WorkerPool& operator=(WorkerPool const&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        std::size_t idleWorkerCount() const;
        std::size_t busyWorkerCount() const;

        /**
         * @brief Hands a shard to an idle worker.
         *
         * @return false if every worker is busy.
         */
        bool dispatch(RunShard shard);

        /**
         * @brief Cancels every busy worker. Workers that are still busy after the grace period are abandoned:
         * their late messages are dropped, their unfinished items are reported as cancelled and a fresh worker
         * takes their place.
         */
        void cancelAll();

        /**
         * @brief Fires the signal of a single item that runs in a shard.
         *
         * @return false if no busy worker holds the item.
         */
        bool cancelItem(Ids::ItemId const& id);

        /**
         * @brief Cancels everything and joins all threads, abandoned ones included.
         */
        void shutdown();

      private:
        struct Worker
        {
            Ids::WorkerId id{};
            std::unique_ptr<Async::ProcessingThread> thread{};
            std::shared_ptr<Async::ProcessingStrand> reportStrand{};
            CancellationSignal cancel{};
            std::vector<Ids::ItemId> pendingItems{};
            std::unordered_map<Ids::ItemId, CancellationSignal, Ids::IdHash> itemSignals{};
            bool busy{false};
        };

        struct RetiredWorker
        {
            std::unique_ptr<Async::ProcessingThread> thread{};
            std::future<void> idle{};
        };

        std::unique_ptr<Worker> makeWorker();
        Worker* findWorker(Ids::WorkerId const& id);
        void onWorkerMessage(Ids::WorkerId const& id, WorkerMessage const& message);
        void reapRetired(bool wait);

        static void runShard(
            RunShard shard,
            std::shared_ptr<NegotiationClient> negotiation,
            std::shared_ptr<IObjectStore> objectStore,
            CancellationSignal cancel,
            TransferJob::Options jobOptions,
            std::function<void(WorkerMessage)> const& report,
            Ids::WorkerId const& worker);

      private:
        Async::ProcessingThread* orchestrator_;
        std::shared_ptr<NegotiationClient> negotiation_;
        std::shared_ptr<IObjectStore> objectStore_;
        Options options_;
        MessageHandler onMessage_;
        std::vector<std::unique_ptr<Worker>> workers_{};
        std::vector<RetiredWorker> retired_{};
    };
}
