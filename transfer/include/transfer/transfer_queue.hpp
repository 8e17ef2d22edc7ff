#pragma once

#include <transfer/payload.hpp>
#include <transfer/validation.hpp>
#include <persistence/queue_store.hpp>
#include <shared_data/transfer/queue_record.hpp>
#include <shared_data/transfer/queue_snapshot.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Transfer
{
    struct QueueItem
    {
        SharedData::QueueRecord record{};
        /// Absent for placeholders restored from the journal.
        std::shared_ptr<IPayload> payload{};
    };

    struct UploadPatch
    {
        std::optional<SharedData::UploadStatus> status{std::nullopt};
        std::optional<int> progress{std::nullopt};
        std::optional<SharedData::TransferError> error{std::nullopt};
        std::optional<std::string> remoteKey{std::nullopt};
        std::optional<Ids::FileId> fileId{std::nullopt};
        std::optional<bool> encrypted{std::nullopt};
    };

    struct DeletePatch
    {
        std::optional<SharedData::DeleteStatus> status{std::nullopt};
        std::optional<std::uint64_t> completedFiles{std::nullopt};
        std::optional<std::uint64_t> failedFiles{std::nullopt};
        std::optional<SharedData::TransferError> error{std::nullopt};
    };

    struct UploadSession
    {
        Ids::SessionId id{};
        std::size_t total{0};
        std::size_t completed{0};
        std::size_t failed{0};
        std::size_t cancelled{0};
        std::chrono::system_clock::time_point startedAt{};
    };

    /**
     * @brief Items handed to the scheduler in one go. Several items only for batch tagged uploads.
     */
    struct Claim
    {
        std::vector<QueueItem> items{};
        std::optional<Ids::BatchId> batchId{std::nullopt};
    };

    /**
     * @brief Owner of all queue items. Every method is thread safe, the change listener is called
     * without the lock being held.
     */
    class TransferQueue
    {
      public:
        struct Options
        {
            Limits limits{};
            std::size_t shardThreshold{100};
            bool autoRemoveCompleted{false};
            std::size_t maxRetainedItems{10'000};
        };

        /// edge is set for activity changes that should reach observers without delay.
        using ChangeListener = std::function<void(bool edge)>;

        TransferQueue(std::shared_ptr<Persistence::IQueueStore> store, Options options);

        void setChangeListener(ChangeListener listener);

        std::expected<Ids::ItemId, SharedData::TransferError>
        enqueue(std::shared_ptr<IPayload> payload, std::string const& destinationPath);

        /**
         * @brief Enqueues all payloads or none. Ids are returned in input order.
         */
        std::expected<std::vector<Ids::ItemId>, SharedData::TransferError>
        enqueueBatch(std::vector<std::shared_ptr<IPayload>> const& payloads, std::string const& destinationPath);

        /**
         * @brief Applies a partial update. Unknown ids and invalid transitions are ignored.
         *
         * @return true if anything changed.
         */
        bool updateItem(Ids::ItemId const& id, UploadPatch const& patch);

        Ids::ItemId addDeleteOperation(std::vector<Ids::FileId> targets);
        bool updateDeleteOperation(Ids::ItemId const& id, DeletePatch const& patch);

        /**
         * @brief Cancels every queued or uploading upload.
         *
         * @return The number of cancelled uploads.
         */
        std::size_t cancelAll();

        /**
         * @brief Cancels a single queued or uploading upload.
         *
         * @return false for unknown ids, delete operations and finished uploads.
         */
        bool cancel(Ids::ItemId const& id);
        void clearAll();

        Ids::SessionId startSession(std::size_t total);
        std::optional<UploadSession> endSession();
        std::optional<UploadSession> session() const;

        SharedData::QueueSnapshot snapshot() const;

        /**
         * @brief Takes the oldest queued item and moves it into its active state. Batch tagged uploads are claimed
         * together with the following queued items of the same batch, up to maxBatchItems.
         * Uploads without payload are failed on the way.
         */
        std::optional<Claim> claimNext(std::size_t maxBatchItems);

        /**
         * @brief Removes terminal items.
         *
         * @return The number of removed items.
         */
        std::size_t acknowledge(std::vector<Ids::ItemId> const& ids);

        /**
         * @brief Removes the oldest terminal items until at most maxRetained items remain.
         */
        std::size_t pruneTerminal(std::size_t maxRetained);

        bool reattachPayload(Ids::ItemId const& id, std::shared_ptr<IPayload> payload);

        /**
         * @brief Fails every queued upload that has no payload attached.
         *
         * @return The number of failed uploads.
         */
        std::size_t failDetached();

        /**
         * @brief Replaces the queue with persisted records. Items that were active are failed as interrupted.
         */
        void restore(std::vector<SharedData::QueueRecord> records);

        std::optional<QueueItem> item(Ids::ItemId const& id) const;
        std::size_t size() const;
        std::size_t queuedCount() const;
        std::size_t activeCount() const;

      private:
        struct Notification
        {
            bool changed{false};
            bool edge{false};
        };

        QueueItem* findLocked(Ids::ItemId const& id);
        QueueItem const* findLocked(Ids::ItemId const& id) const;
        bool busyLocked() const;
        void countLocked(SharedData::QueueRecord const& record, int direction);
        void transitionLocked(
            QueueItem& item,
            SharedData::UploadStatus status,
            std::optional<SharedData::TransferError> error = std::nullopt);
        void transitionLocked(
            QueueItem& item,
            SharedData::DeleteStatus status,
            std::optional<SharedData::TransferError> error = std::nullopt);
        std::size_t pruneTerminalLocked(std::size_t maxRetained);
        void eraseLocked(std::vector<Ids::ItemId> const& ids);
        void persistLocked(SharedData::QueueRecord const& record);
        void persistLocked(std::vector<SharedData::QueueRecord> const& records);
        void notify(Notification notification);

      private:
        std::shared_ptr<Persistence::IQueueStore> store_;
        Options options_;
        mutable std::mutex mutex_{};
        ChangeListener listener_{};
        std::map<std::uint64_t, QueueItem> items_{};
        std::unordered_map<Ids::ItemId, std::uint64_t, Ids::IdHash> index_{};
        std::uint64_t nextSequence_{0};
        std::size_t queued_{0};
        std::size_t active_{0};
        std::optional<UploadSession> session_{std::nullopt};
    };
}
