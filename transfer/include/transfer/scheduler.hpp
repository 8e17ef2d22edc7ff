#pragma once

#include <transfer/cancellation_signal.hpp>
#include <transfer/delete_runner.hpp>
#include <transfer/negotiation_client.hpp>
#include <transfer/object_store.hpp>
#include <transfer/transfer_job.hpp>
#include <transfer/transfer_queue.hpp>
#include <transfer/worker_pool.hpp>
#include <async/processing_thread.hpp>
#include <ids/ids.hpp>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace Transfer
{
    /**
     * @brief Keeps up to concurrency transfers in flight. All bookkeeping is confined to the orchestrator thread,
     * single transfers and delete operations run on a thread pool, shards of large batches on the worker pool.
     */
    class Scheduler : public std::enable_shared_from_this<Scheduler>
    {
      public:
        struct Options
        {
            std::size_t concurrency{24};
            std::size_t shardSize{50};
            WorkerPool::Options workers{};
            TransferJob::Options job{};
        };

        Scheduler(
            std::shared_ptr<TransferQueue> queue,
            std::shared_ptr<NegotiationClient> negotiation,
            std::shared_ptr<IObjectStore> objectStore,
            Options options);
        ~Scheduler();
        Scheduler(Scheduler const&) = delete;
        Scheduler& operator=(Scheduler const&) = delete;
        Scheduler(Scheduler&&) = delete;
        Scheduler& operator=(Scheduler&&) = delete;

        void start();

        /**
         * @brief Cancels all work, waits for the pools and stops the orchestrator thread.
         */
        void stop();

        bool isRunning() const
        {
            return running_.load();
        }

        /**
         * @brief Claims queued items until all slots are taken.
         */
        void wake();

        /**
         * @brief Fires the current cancellation signal, replaces it with a fresh one and frees all upload slots.
         * Delete operations are not affected.
         *
         * @param settleQueue Runs on the orchestrator before the signal is replaced, so no item can be claimed
         * between the two.
         */
        void cancelAll(std::function<void()> const& settleQueue = {});

        /**
         * @brief Fires the signal of one running upload. Its slot is freed once the transfer stopped.
         *
         * @param settleQueue Runs on the orchestrator before the signal is fired.
         * @return false if the item is not running.
         */
        bool cancel(Ids::ItemId const& id, std::function<void()> const& settleQueue = {});

        /**
         * @brief Stops claiming new items. Running transfers continue. May be called before start().
         */
        void pause();
        void resume();
        bool isPaused() const
        {
            return pausedMirror_.load();
        }

        void setEncryption(std::optional<EncryptionContext> encryption);

        std::size_t activeCount() const
        {
            return activeMirror_.load();
        }

        /// Highest number of occupied slots since start.
        std::size_t peakActiveCount() const
        {
            return peakActive_.load();
        }

      private:
        void tick();
        void launch(Claim claim);
        void launchJob(QueueItem item);
        void launchDelete(QueueItem item);
        void onJobFinished(std::uint64_t generation, JobOutcome const& outcome);
        void onDeleteFinished();
        void onWorkerMessage(WorkerMessage const& message);
        void occupy(std::size_t slots);
        void release(std::size_t slots);

        template <typename FunctionT>
        void runOnOrchestrator(FunctionT&& func);

      private:
        std::shared_ptr<TransferQueue> queue_;
        std::shared_ptr<NegotiationClient> negotiation_;
        std::shared_ptr<IObjectStore> objectStore_;
        Options options_;

        Async::ProcessingThread orchestrator_{};
        std::unique_ptr<boost::asio::thread_pool> pool_{};
        std::unique_ptr<WorkerPool> workers_{};
        std::atomic_bool running_{false};

        // Orchestrator thread only:
        CancellationSignal cancel_{};
        CancellationSignal shutdown_{};
        std::optional<EncryptionContext> encryption_{std::nullopt};
        std::uint64_t generation_{0};
        std::size_t active_{0};
        std::size_t runningDeletes_{0};
        std::unordered_set<Ids::ItemId, Ids::IdHash> shardItems_{};
        std::unordered_map<Ids::ItemId, CancellationSignal, Ids::IdHash> jobSignals_{};
        bool stopping_{false};
        bool paused_{false};

        std::atomic_bool pausedMirror_{false};
        std::atomic_size_t activeMirror_{0};
        std::atomic_size_t peakActive_{0};
    };
}
