#include <transfer/transfer_queue.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/overloaded.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace Transfer
{
    namespace
    {
        SharedData::ItemView makeView(SharedData::QueueRecord const& record)
        {
            SharedData::ItemView view{
                .id = record.id,
                .kind = record.kind(),
                .error = record.error ? std::optional<std::string>{record.error->toString()} : std::nullopt,
                .lastUpdate = record.updatedAt,
            };
            std::visit(
                Utility::overloaded{
                    [&view](SharedData::UploadRecord const& upload) {
                        view.name = upload.name;
                        view.destinationPath = upload.destinationPath;
                        view.status = Utility::enumToString(upload.status);
                        view.progress = upload.progress;
                        view.remoteKey = upload.remoteKey;
                        view.fileId = upload.fileId;
                    },
                    [&view](SharedData::DeleteRecord const& deletion) {
                        view.name = fmt::format("Deleting {} files", deletion.totalFiles);
                        view.status = Utility::enumToString(deletion.status);
                        view.progress = deletion.progress;
                        view.completedFiles = deletion.completedFiles;
                        view.totalFiles = deletion.totalFiles;
                    },
                },
                record.body);
            return view;
        }

        int deleteProgress(SharedData::DeleteRecord const& deletion)
        {
            if (deletion.totalFiles == 0)
                return 100;
            return static_cast<int>(deletion.completedFiles * 100 / deletion.totalFiles);
        }
    }

    TransferQueue::TransferQueue(std::shared_ptr<Persistence::IQueueStore> store, Options options)
        : store_{std::move(store)}
        , options_{std::move(options)}
    {}

    void TransferQueue::setChangeListener(ChangeListener listener)
    {
        std::scoped_lock lock{mutex_};
        listener_ = std::move(listener);
    }

    void TransferQueue::notify(Notification notification)
    {
        if (!notification.changed)
            return;

        ChangeListener listener{};
        {
            std::scoped_lock lock{mutex_};
            listener = listener_;
        }
        if (listener)
            listener(notification.edge);
    }

    QueueItem* TransferQueue::findLocked(Ids::ItemId const& id)
    {
        auto indexIter = index_.find(id);
        if (indexIter == index_.end())
            return nullptr;
        auto iter = items_.find(indexIter->second);
        return iter == items_.end() ? nullptr : &iter->second;
    }

    QueueItem const* TransferQueue::findLocked(Ids::ItemId const& id) const
    {
        auto indexIter = index_.find(id);
        if (indexIter == index_.end())
            return nullptr;
        auto iter = items_.find(indexIter->second);
        return iter == items_.end() ? nullptr : &iter->second;
    }

    bool TransferQueue::busyLocked() const
    {
        return queued_ + active_ > 0;
    }

    void TransferQueue::countLocked(SharedData::QueueRecord const& record, int direction)
    {
        if (record.isQueued())
            queued_ = static_cast<std::size_t>(static_cast<long long>(queued_) + direction);
        else if (record.isActive())
            active_ = static_cast<std::size_t>(static_cast<long long>(active_) + direction);
    }

    void TransferQueue::transitionLocked(
        QueueItem& item,
        SharedData::UploadStatus status,
        std::optional<SharedData::TransferError> error)
    {
        using enum SharedData::UploadStatus;

        auto& upload = *item.record.upload();
        countLocked(item.record, -1);
        upload.status = status;
        if (status == Uploading)
            upload.progress = 0;
        else if (status == Completed)
            upload.progress = 100;
        else if (status == Cancelled)
            upload.progress = 0;
        if (error)
            item.record.error = std::move(error);
        item.record.updatedAt = std::chrono::system_clock::now();
        countLocked(item.record, +1);

        if (session_ && SharedData::isTerminal(status))
        {
            if (status == Completed)
                ++session_->completed;
            else if (status == Failed)
                ++session_->failed;
            else
                ++session_->cancelled;
        }
    }

    void TransferQueue::transitionLocked(
        QueueItem& item,
        SharedData::DeleteStatus status,
        std::optional<SharedData::TransferError> error)
    {
        auto& deletion = *item.record.deletion();
        countLocked(item.record, -1);
        deletion.status = status;
        if (status == SharedData::DeleteStatus::Completed)
            deletion.progress = 100;
        if (error)
            item.record.error = std::move(error);
        item.record.updatedAt = std::chrono::system_clock::now();
        countLocked(item.record, +1);
    }

    void TransferQueue::persistLocked(SharedData::QueueRecord const& record)
    {
        if (auto result = store_->put(record); !result)
            Log::error("TransferQueue: Could not persist {}: {}", record.id.value(), result.error().toString());
    }

    void TransferQueue::persistLocked(std::vector<SharedData::QueueRecord> const& records)
    {
        if (records.empty())
            return;
        if (auto result = store_->putMany(records); !result)
            Log::error("TransferQueue: Could not persist {} records: {}", records.size(), result.error().toString());
    }

    void TransferQueue::eraseLocked(std::vector<Ids::ItemId> const& ids)
    {
        if (ids.empty())
            return;
        for (auto const& id : ids)
        {
            auto indexIter = index_.find(id);
            if (indexIter == index_.end())
                continue;
            if (auto iter = items_.find(indexIter->second); iter != items_.end())
            {
                countLocked(iter->second.record, -1);
                items_.erase(iter);
            }
            index_.erase(indexIter);
        }
        if (auto result = store_->removeMany(ids); !result)
            Log::error("TransferQueue: Could not remove {} records: {}", ids.size(), result.error().toString());
    }

    std::expected<Ids::ItemId, SharedData::TransferError>
    TransferQueue::enqueue(std::shared_ptr<IPayload> payload, std::string const& destinationPath)
    {
        auto ids = enqueueBatch({std::move(payload)}, destinationPath);
        if (!ids)
            return std::unexpected(ids.error());
        return ids->front();
    }

    std::expected<std::vector<Ids::ItemId>, SharedData::TransferError> TransferQueue::enqueueBatch(
        std::vector<std::shared_ptr<IPayload>> const& payloads,
        std::string const& destinationPath)
    {
        if (payloads.empty())
            return std::vector<Ids::ItemId>{};

        if (auto valid = validateBatch(payloads, options_.limits); !valid)
        {
            Log::warn("TransferQueue: Rejected batch of {} files: {}", payloads.size(), valid.error().toString());
            return std::unexpected(valid.error());
        }

        Notification notification{.changed = true};
        std::vector<Ids::ItemId> ids{};
        ids.reserve(payloads.size());
        {
            std::scoped_lock lock{mutex_};
            const bool wasBusy = busyLocked();

            std::optional<Ids::BatchId> batchId{std::nullopt};
            if (payloads.size() > 1 && options_.shardThreshold != 0 && payloads.size() >= options_.shardThreshold)
                batchId = Ids::generateBatchId();

            const auto now = std::chrono::system_clock::now();
            std::vector<SharedData::QueueRecord> records{};
            records.reserve(payloads.size());
            for (auto const& payload : payloads)
            {
                SharedData::QueueRecord record{
                    .id = Ids::generateItemId(),
                    .sequence = nextSequence_++,
                    .createdAt = now,
                    .updatedAt = now,
                    .body =
                        SharedData::UploadRecord{
                            .name = payload->name(),
                            .destinationPath = destinationPath,
                            .size = payload->size(),
                            .mimeType = payload->mimeType(),
                            .batchId = batchId,
                        },
                };
                ids.push_back(record.id);
                index_.emplace(record.id, record.sequence);
                countLocked(record, +1);
                records.push_back(record);
                items_.emplace(record.sequence, QueueItem{.record = std::move(record), .payload = payload});
            }
            persistLocked(records);
            notification.edge = wasBusy != busyLocked();

            Log::info(
                "TransferQueue: Enqueued {} files into '{}'{}.",
                payloads.size(),
                destinationPath,
                batchId ? fmt::format(" as batch {}", batchId->value()) : std::string{});
        }
        notify(notification);
        return ids;
    }

    bool TransferQueue::updateItem(Ids::ItemId const& id, UploadPatch const& patch)
    {
        using enum SharedData::UploadStatus;

        Notification notification{};
        {
            std::scoped_lock lock{mutex_};
            auto* item = findLocked(id);
            if (!item || !item->record.upload())
            {
                Log::debug("TransferQueue: Ignoring update of unknown upload {}.", id.value());
                return false;
            }

            auto& upload = *item->record.upload();
            if (SharedData::isTerminal(upload.status))
            {
                Log::debug("TransferQueue: Ignoring update of settled upload {}.", id.value());
                return false;
            }
            if (patch.status && *patch.status != upload.status &&
                !SharedData::isValidTransition(upload.status, *patch.status))
            {
                Log::debug(
                    "TransferQueue: Ignoring transition {} -> {} of {}.",
                    Utility::enumToString(upload.status),
                    Utility::enumToString(*patch.status),
                    id.value());
                return false;
            }

            const bool wasBusy = busyLocked();
            bool persistable = false;

            if (patch.remoteKey && patch.remoteKey != upload.remoteKey)
            {
                upload.remoteKey = patch.remoteKey;
                persistable = true;
            }
            if (patch.fileId && patch.fileId != upload.fileId)
            {
                upload.fileId = patch.fileId;
                persistable = true;
            }
            if (patch.encrypted && *patch.encrypted != upload.encrypted)
            {
                upload.encrypted = *patch.encrypted;
                persistable = true;
            }
            if (patch.error && !patch.status)
            {
                item->record.error = patch.error;
                persistable = true;
            }

            if (patch.status && *patch.status != upload.status)
            {
                transitionLocked(*item, *patch.status, patch.error);
                persistable = true;
            }

            bool progressChanged = false;
            if (patch.progress && !SharedData::isTerminal(upload.status))
            {
                const auto progress = std::clamp(*patch.progress, 0, 100);
                if (upload.status != Uploading || progress > upload.progress)
                {
                    progressChanged = progress != upload.progress;
                    upload.progress = progress;
                    item->record.updatedAt = std::chrono::system_clock::now();
                }
            }

            if (!persistable && !progressChanged)
                return false;

            if (persistable)
            {
                if (upload.status == Completed && options_.autoRemoveCompleted)
                    eraseLocked({id});
                else
                    persistLocked(item->record);
            }

            notification = Notification{.changed = true, .edge = wasBusy != busyLocked()};
        }
        notify(notification);
        return true;
    }

    Ids::ItemId TransferQueue::addDeleteOperation(std::vector<Ids::FileId> targets)
    {
        Notification notification{.changed = true};
        Ids::ItemId id = Ids::generateItemId();
        {
            std::scoped_lock lock{mutex_};
            const bool wasBusy = busyLocked();
            const auto now = std::chrono::system_clock::now();
            const auto total = static_cast<std::uint64_t>(targets.size());
            SharedData::QueueRecord record{
                .id = id,
                .sequence = nextSequence_++,
                .createdAt = now,
                .updatedAt = now,
                .body =
                    SharedData::DeleteRecord{
                        .targets = std::move(targets),
                        .totalFiles = total,
                    },
            };
            index_.emplace(record.id, record.sequence);
            countLocked(record, +1);
            persistLocked(record);
            items_.emplace(record.sequence, QueueItem{.record = std::move(record)});
            notification.edge = wasBusy != busyLocked();
            Log::info("TransferQueue: Added delete operation {} for {} files.", id.value(), total);
        }
        notify(notification);
        return id;
    }

    bool TransferQueue::updateDeleteOperation(Ids::ItemId const& id, DeletePatch const& patch)
    {
        Notification notification{};
        {
            std::scoped_lock lock{mutex_};
            auto* item = findLocked(id);
            if (!item || !item->record.deletion())
            {
                Log::debug("TransferQueue: Ignoring update of unknown delete operation {}.", id.value());
                return false;
            }

            auto& deletion = *item->record.deletion();
            if (SharedData::isTerminal(deletion.status))
                return false;
            if (patch.status && *patch.status != deletion.status &&
                !SharedData::isValidTransition(deletion.status, *patch.status))
            {
                Log::debug(
                    "TransferQueue: Ignoring transition {} -> {} of {}.",
                    Utility::enumToString(deletion.status),
                    Utility::enumToString(*patch.status),
                    id.value());
                return false;
            }

            const bool wasBusy = busyLocked();
            if (patch.completedFiles)
                deletion.completedFiles = std::max(deletion.completedFiles, std::min(*patch.completedFiles, deletion.totalFiles));
            if (patch.failedFiles)
                deletion.failedFiles = std::min(*patch.failedFiles, deletion.totalFiles);
            deletion.progress = deleteProgress(deletion);
            item->record.updatedAt = std::chrono::system_clock::now();

            if (patch.status && *patch.status != deletion.status)
                transitionLocked(*item, *patch.status, patch.error);
            else if (patch.error)
                item->record.error = patch.error;

            persistLocked(item->record);
            notification = Notification{.changed = true, .edge = wasBusy != busyLocked()};
        }
        notify(notification);
        return true;
    }

    std::size_t TransferQueue::cancelAll()
    {
        using enum SharedData::UploadStatus;

        std::size_t cancelled = 0;
        {
            std::scoped_lock lock{mutex_};
            std::vector<SharedData::QueueRecord> changed{};
            for (auto& [sequence, item] : items_)
            {
                auto const* upload = item.record.upload();
                if (!upload || (upload->status != Queued && upload->status != Uploading))
                    continue;
                transitionLocked(item, Cancelled);
                changed.push_back(item.record);
            }
            persistLocked(changed);
            cancelled = changed.size();
        }
        Log::info("TransferQueue: Cancelled {} uploads.", cancelled);
        notify(Notification{.changed = true, .edge = true});
        return cancelled;
    }

    bool TransferQueue::cancel(Ids::ItemId const& id)
    {
        using enum SharedData::UploadStatus;

        Notification notification{};
        {
            std::scoped_lock lock{mutex_};
            auto* item = findLocked(id);
            if (!item || !item->record.upload())
                return false;
            const auto status = item->record.upload()->status;
            if (status != Queued && status != Uploading)
                return false;

            const bool wasBusy = busyLocked();
            transitionLocked(*item, Cancelled);
            persistLocked(item->record);
            notification = Notification{.changed = true, .edge = wasBusy != busyLocked()};
        }
        Log::info("TransferQueue: Cancelled {}.", id.value());
        notify(notification);
        return true;
    }

    void TransferQueue::clearAll()
    {
        {
            std::scoped_lock lock{mutex_};
            items_.clear();
            index_.clear();
            queued_ = 0;
            active_ = 0;
            session_.reset();
            if (auto result = store_->clear(); !result)
                Log::error("TransferQueue: Could not clear the store: {}", result.error().toString());
        }
        Log::info("TransferQueue: Cleared.");
        notify(Notification{.changed = true, .edge = true});
    }

    Ids::SessionId TransferQueue::startSession(std::size_t total)
    {
        auto id = Ids::generateSessionId();
        {
            std::scoped_lock lock{mutex_};
            if (session_)
                Log::warn("TransferQueue: Session {} replaced before it ended.", session_->id.value());
            session_ = UploadSession{
                .id = id,
                .total = total,
                .startedAt = std::chrono::system_clock::now(),
            };
        }
        Log::info("TransferQueue: Session {} started for {} files.", id.value(), total);
        notify(Notification{.changed = true, .edge = true});
        return id;
    }

    std::optional<UploadSession> TransferQueue::endSession()
    {
        std::optional<UploadSession> ended{std::nullopt};
        {
            std::scoped_lock lock{mutex_};
            ended = std::exchange(session_, std::nullopt);
            if (ended)
            {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now() - ended->startedAt);
                Log::info(
                    "TransferQueue: Session {} ended after {} ms: {} succeeded, {} failed, {} cancelled of {}.",
                    ended->id.value(),
                    elapsed.count(),
                    ended->completed,
                    ended->failed,
                    ended->cancelled,
                    ended->total);
            }
            pruneTerminalLocked(options_.maxRetainedItems);
        }
        notify(Notification{.changed = true, .edge = true});
        return ended;
    }

    std::optional<UploadSession> TransferQueue::session() const
    {
        std::scoped_lock lock{mutex_};
        return session_;
    }

    SharedData::QueueSnapshot TransferQueue::snapshot() const
    {
        using SharedData::DeleteStatus;
        using SharedData::UploadStatus;

        std::scoped_lock lock{mutex_};
        SharedData::QueueSnapshot snapshot{
            .isRunning = active_ > 0,
            .activeCount = active_,
            .total = items_.size(),
        };

        for (auto const& [sequence, item] : items_)
        {
            std::visit(
                Utility::overloaded{
                    [&snapshot](SharedData::UploadRecord const& upload) {
                        ++snapshot.uploadTotal;
                        snapshot.totalSize += upload.size;
                        switch (upload.status)
                        {
                            case UploadStatus::Queued:
                                ++snapshot.queued;
                                ++snapshot.uploadQueued;
                                break;
                            case UploadStatus::Uploading:
                                ++snapshot.inProgress;
                                ++snapshot.uploadInProgress;
                                break;
                            case UploadStatus::Completed:
                                ++snapshot.completed;
                                ++snapshot.uploadCompleted;
                                break;
                            case UploadStatus::Failed:
                                ++snapshot.failed;
                                ++snapshot.uploadFailed;
                                break;
                            case UploadStatus::Cancelled:
                                ++snapshot.cancelled;
                                ++snapshot.uploadCancelled;
                                break;
                        }
                    },
                    [&snapshot](SharedData::DeleteRecord const& deletion) {
                        ++snapshot.deleteOperationsCount;
                        switch (deletion.status)
                        {
                            case DeleteStatus::Queued:
                                ++snapshot.queued;
                                break;
                            case DeleteStatus::Deleting:
                                ++snapshot.inProgress;
                                ++snapshot.deleteInProgress;
                                break;
                            case DeleteStatus::Completed:
                                ++snapshot.completed;
                                break;
                            case DeleteStatus::Failed:
                                ++snapshot.failed;
                                break;
                        }
                    },
                },
                item.record.body);
        }

        if (session_)
        {
            snapshot.sessionActive = true;
            snapshot.uploadTotal = session_->total;
            snapshot.uploadCompleted = session_->completed;
            snapshot.uploadFailed = session_->failed;
            snapshot.uploadCancelled = session_->cancelled;
        }

        if (snapshot.uploadTotal > 0)
            snapshot.percentage =
                static_cast<int>(std::min<std::size_t>(100, snapshot.uploadCompleted * 100 / snapshot.uploadTotal));

        for (auto iter = items_.rbegin(); iter != items_.rend(); ++iter)
        {
            auto const& record = iter->second.record;
            if (record.upload() && snapshot.items.size() < SharedData::QueueSnapshot::maxItemViews)
                snapshot.items.push_back(makeView(record));
            else if (record.deletion() && snapshot.deleteOperations.size() < SharedData::QueueSnapshot::maxDeleteViews)
                snapshot.deleteOperations.push_back(makeView(record));

            if (snapshot.items.size() == SharedData::QueueSnapshot::maxItemViews &&
                snapshot.deleteOperations.size() == SharedData::QueueSnapshot::maxDeleteViews)
                break;
        }
        std::reverse(snapshot.items.begin(), snapshot.items.end());
        std::reverse(snapshot.deleteOperations.begin(), snapshot.deleteOperations.end());
        return snapshot;
    }

    std::optional<Claim> TransferQueue::claimNext(std::size_t maxBatchItems)
    {
        using enum SharedData::UploadStatus;

        std::optional<Claim> claim{std::nullopt};
        Notification notification{};
        {
            std::scoped_lock lock{mutex_};
            if (queued_ == 0)
                return std::nullopt;

            const bool wasBusy = busyLocked();
            std::vector<SharedData::QueueRecord> changed{};

            const auto failUnavailable = [this, &changed](QueueItem& item) {
                Log::warn("TransferQueue: Payload of '{}' is not available anymore.", item.record.upload()->name);
                transitionLocked(
                    item,
                    Failed,
                    SharedData::TransferError{
                        .type = SharedData::TransferErrorType::PayloadUnavailable,
                        .message = "The file content is not available anymore",
                    });
                changed.push_back(item.record);
            };
            const auto take = [this, &changed, &claim](QueueItem& item) {
                transitionLocked(item, Uploading);
                changed.push_back(item.record);
                claim->items.push_back(item);
            };

            for (auto iter = items_.begin(); iter != items_.end() && !claim; ++iter)
            {
                auto& item = iter->second;
                if (!item.record.isQueued())
                    continue;

                if (item.record.deletion())
                {
                    transitionLocked(item, SharedData::DeleteStatus::Deleting);
                    changed.push_back(item.record);
                    claim = Claim{.items = {item}};
                    break;
                }

                if (!item.payload)
                {
                    failUnavailable(item);
                    continue;
                }

                const auto batchId = item.record.upload()->batchId;
                claim = Claim{.batchId = batchId};
                take(item);
                if (!batchId)
                    break;

                for (auto next = std::next(iter); next != items_.end() && claim->items.size() < maxBatchItems; ++next)
                {
                    auto& candidate = next->second;
                    if (!candidate.record.isQueued())
                        continue;
                    auto const* upload = candidate.record.upload();
                    if (!upload || upload->batchId != batchId)
                        break;
                    if (!candidate.payload)
                    {
                        failUnavailable(candidate);
                        continue;
                    }
                    take(candidate);
                }
            }

            persistLocked(changed);
            notification = Notification{.changed = !changed.empty(), .edge = wasBusy != busyLocked()};
        }
        notify(notification);
        return claim;
    }

    std::size_t TransferQueue::acknowledge(std::vector<Ids::ItemId> const& ids)
    {
        std::vector<Ids::ItemId> removable{};
        {
            std::scoped_lock lock{mutex_};
            for (auto const& id : ids)
            {
                if (auto const* item = findLocked(id); item && item->record.isTerminal())
                    removable.push_back(id);
            }
            eraseLocked(removable);
        }
        notify(Notification{.changed = !removable.empty()});
        return removable.size();
    }

    std::size_t TransferQueue::pruneTerminalLocked(std::size_t maxRetained)
    {
        if (session_ || items_.size() <= maxRetained)
            return 0;

        auto excess = items_.size() - maxRetained;
        std::vector<Ids::ItemId> removable{};
        for (auto const& [sequence, item] : items_)
        {
            if (removable.size() == excess)
                break;
            if (item.record.isTerminal())
                removable.push_back(item.record.id);
        }
        eraseLocked(removable);
        if (!removable.empty())
            Log::info("TransferQueue: Pruned {} settled items.", removable.size());
        return removable.size();
    }

    std::size_t TransferQueue::pruneTerminal(std::size_t maxRetained)
    {
        std::size_t pruned = 0;
        {
            std::scoped_lock lock{mutex_};
            pruned = pruneTerminalLocked(maxRetained);
        }
        notify(Notification{.changed = pruned > 0});
        return pruned;
    }

    bool TransferQueue::reattachPayload(Ids::ItemId const& id, std::shared_ptr<IPayload> payload)
    {
        std::scoped_lock lock{mutex_};
        auto* item = findLocked(id);
        if (!item || !payload || !item->record.upload() || item->record.upload()->status != SharedData::UploadStatus::Queued)
            return false;
        item->payload = std::move(payload);
        return true;
    }

    std::size_t TransferQueue::failDetached()
    {
        std::vector<SharedData::QueueRecord> changed{};
        Notification notification{};
        {
            std::scoped_lock lock{mutex_};
            const bool wasBusy = busyLocked();
            for (auto& [sequence, item] : items_)
            {
                if (!item.record.upload() || !item.record.isQueued() || item.payload)
                    continue;
                transitionLocked(
                    item,
                    SharedData::UploadStatus::Failed,
                    SharedData::TransferError{
                        .type = SharedData::TransferErrorType::PayloadUnavailable,
                        .message = "The file content is not available anymore",
                    });
                changed.push_back(item.record);
            }
            if (changed.empty())
                return 0;
            persistLocked(changed);
            notification = Notification{.changed = true, .edge = wasBusy != busyLocked()};
        }
        Log::info("TransferQueue: {} restored uploads have no content.", changed.size());
        notify(notification);
        return changed.size();
    }

    void TransferQueue::restore(std::vector<SharedData::QueueRecord> records)
    {
        std::size_t interrupted = 0;
        {
            std::scoped_lock lock{mutex_};
            items_.clear();
            index_.clear();
            queued_ = 0;
            active_ = 0;
            nextSequence_ = 0;

            const SharedData::TransferError interruption{
                .type = SharedData::TransferErrorType::Interrupted,
                .message = "The engine stopped while this item was active",
            };
            std::vector<SharedData::QueueRecord> changed{};
            for (auto& record : records)
            {
                nextSequence_ = std::max(nextSequence_, record.sequence + 1);
                const auto sequence = record.sequence;
                index_.emplace(record.id, sequence);
                auto& item = items_.insert_or_assign(sequence, QueueItem{.record = std::move(record)}).first->second;
                countLocked(item.record, +1);

                if (item.record.isActive())
                {
                    if (item.record.upload())
                        transitionLocked(item, SharedData::UploadStatus::Failed, interruption);
                    else
                        transitionLocked(item, SharedData::DeleteStatus::Failed, interruption);
                    changed.push_back(item.record);
                }
            }
            persistLocked(changed);
            interrupted = changed.size();
            Log::info(
                "TransferQueue: Restored {} items, {} queued, {} were interrupted.", items_.size(), queued_, interrupted);
        }
        notify(Notification{.changed = true, .edge = true});
    }

    std::optional<QueueItem> TransferQueue::item(Ids::ItemId const& id) const
    {
        std::scoped_lock lock{mutex_};
        if (auto const* item = findLocked(id); item)
            return *item;
        return std::nullopt;
    }

    std::size_t TransferQueue::size() const
    {
        std::scoped_lock lock{mutex_};
        return items_.size();
    }
    std::size_t TransferQueue::queuedCount() const
    {
        std::scoped_lock lock{mutex_};
        return queued_;
    }
    std::size_t TransferQueue::activeCount() const
    {
        std::scoped_lock lock{mutex_};
        return active_;
    }
}
