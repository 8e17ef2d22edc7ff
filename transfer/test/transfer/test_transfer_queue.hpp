#pragma once

#include "helpers.hpp"

#include <transfer/transfer_queue.hpp>
#include <persistence/mocks/queue_store_mock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace Transfer::Test
{
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    class TransferQueueTests : public ::testing::Test
    {
      protected:
        std::shared_ptr<TransferQueue> makeQueue(TransferQueue::Options options = {})
        {
            return std::make_shared<TransferQueue>(store_, options);
        }

        static SharedData::UploadStatus statusOf(TransferQueue const& queue, Ids::ItemId const& id)
        {
            return queue.item(id)->record.upload()->status;
        }

      protected:
        std::shared_ptr<NiceMock<Persistence::Test::QueueStoreMock>> store_{
            std::make_shared<NiceMock<Persistence::Test::QueueStoreMock>>()};
    };

    TEST_F(TransferQueueTests, BatchIsPersistedWithOneWriteInInputOrder)
    {
        EXPECT_CALL(*store_, putMany(_)).WillOnce([](std::vector<SharedData::QueueRecord> const& records) {
            EXPECT_EQ(records.size(), 3);
            EXPECT_EQ(records[0].upload()->name, "file_0.bin");
            EXPECT_EQ(records[2].upload()->name, "file_2.bin");
            EXPECT_LT(records[0].sequence, records[1].sequence);
            return std::expected<void, Persistence::StoreError>{};
        });

        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(3), "docs");
        ASSERT_TRUE(ids.has_value());
        ASSERT_EQ(ids->size(), 3);
        EXPECT_EQ(queue->item(ids->front())->record.upload()->name, "file_0.bin");
        EXPECT_EQ(queue->queuedCount(), 3);
    }

    TEST_F(TransferQueueTests, InvalidBatchIsRejectedWithoutAnyMutation)
    {
        EXPECT_CALL(*store_, putMany(_)).Times(0);

        auto queue = makeQueue({.limits = Limits{.maxFileSize = 1000}});
        auto payloads = makePayloads(2, 10);
        payloads.push_back(makePayload("too_big.bin", 2000));

        auto ids = queue->enqueueBatch(payloads, "");
        ASSERT_FALSE(ids.has_value());
        EXPECT_EQ(ids.error().type, SharedData::TransferErrorType::Validation);
        EXPECT_EQ(queue->size(), 0);
    }

    TEST_F(TransferQueueTests, OnlyLargeBatchesAreTaggedForSharding)
    {
        auto queue = makeQueue({.shardThreshold = 3});
        auto small = queue->enqueueBatch(makePayloads(2), "");
        auto large = queue->enqueueBatch(makePayloads(3), "");
        ASSERT_TRUE(small && large);

        EXPECT_FALSE(queue->item(small->front())->record.upload()->batchId.has_value());
        auto const batchId = queue->item(large->front())->record.upload()->batchId;
        ASSERT_TRUE(batchId.has_value());
        EXPECT_EQ(queue->item(large->back())->record.upload()->batchId, batchId);
    }

    TEST_F(TransferQueueTests, ProgressOnlyGrowsWhileUploading)
    {
        auto queue = makeQueue();
        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());

        EXPECT_TRUE(queue->updateItem(id, {.progress = 40}));
        EXPECT_FALSE(queue->updateItem(id, {.progress = 20}));
        EXPECT_TRUE(queue->updateItem(id, {.progress = 250}));
        EXPECT_EQ(queue->item(id)->record.upload()->progress, 100);
    }

    TEST_F(TransferQueueTests, SettledItemsIgnoreFurtherUpdates)
    {
        auto queue = makeQueue();
        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        ASSERT_TRUE(queue->updateItem(id, {.status = SharedData::UploadStatus::Completed}));

        EXPECT_FALSE(queue->updateItem(id, {.status = SharedData::UploadStatus::Failed}));
        EXPECT_FALSE(queue->updateItem(Ids::generateItemId(), {.progress = 10}));
        EXPECT_EQ(statusOf(*queue, id), SharedData::UploadStatus::Completed);
        EXPECT_EQ(queue->item(id)->record.upload()->progress, 100);
    }

    TEST_F(TransferQueueTests, QueuedItemCannotJumpToCompleted)
    {
        auto queue = makeQueue();
        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        EXPECT_FALSE(queue->updateItem(id, {.status = SharedData::UploadStatus::Completed}));
        EXPECT_EQ(statusOf(*queue, id), SharedData::UploadStatus::Queued);
    }

    TEST_F(TransferQueueTests, CancelAllLeavesNothingQueuedOrUploading)
    {
        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(4), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        ASSERT_TRUE(queue->updateItem(ids[0], {.progress = 50}));

        EXPECT_CALL(*store_, putMany(_)).WillOnce([](std::vector<SharedData::QueueRecord> const& records) {
            EXPECT_EQ(records.size(), 4);
            return std::expected<void, Persistence::StoreError>{};
        });
        EXPECT_EQ(queue->cancelAll(), 4);

        const auto snapshot = queue->snapshot();
        EXPECT_EQ(snapshot.uploadQueued, 0);
        EXPECT_EQ(snapshot.uploadInProgress, 0);
        EXPECT_EQ(snapshot.uploadCancelled, 4);
        EXPECT_EQ(queue->item(ids[0])->record.upload()->progress, 0);
    }

    TEST_F(TransferQueueTests, SessionTotalIsNotAffectedByUnrelatedEnqueues)
    {
        auto queue = makeQueue();
        queue->startSession(100);
        ASSERT_TRUE(queue->enqueueBatch(makePayloads(10), "").has_value());

        auto claim = queue->claimNext(1);
        ASSERT_TRUE(claim.has_value());
        ASSERT_TRUE(queue->updateItem(claim->items.front().record.id, {.status = SharedData::UploadStatus::Completed}));

        const auto snapshot = queue->snapshot();
        EXPECT_TRUE(snapshot.sessionActive);
        EXPECT_EQ(snapshot.uploadTotal, 100);
        EXPECT_EQ(snapshot.uploadCompleted, 1);
        EXPECT_EQ(snapshot.percentage, 1);
        EXPECT_EQ(snapshot.total, 10);
    }

    TEST_F(TransferQueueTests, EndingSessionPrunesBeyondRetainedMaximum)
    {
        auto queue = makeQueue({.maxRetainedItems = 2});
        queue->startSession(4);
        auto ids = queue->enqueueBatch(makePayloads(4), "").value();
        for (auto const& id : ids)
        {
            ASSERT_TRUE(queue->claimNext(1).has_value());
            ASSERT_TRUE(queue->updateItem(id, {.status = SharedData::UploadStatus::Completed}));
        }
        EXPECT_EQ(queue->pruneTerminal(2), 0);

        auto session = queue->endSession();
        ASSERT_TRUE(session.has_value());
        EXPECT_EQ(session->completed, 4);
        EXPECT_EQ(queue->size(), 2);
        EXPECT_FALSE(queue->item(ids[0]).has_value());
        EXPECT_TRUE(queue->item(ids[3]).has_value());
    }

    TEST_F(TransferQueueTests, ClaimTakesBatchMembersTogether)
    {
        auto queue = makeQueue({.shardThreshold = 5});
        ASSERT_TRUE(queue->enqueueBatch(makePayloads(6), "").has_value());

        auto claim = queue->claimNext(4);
        ASSERT_TRUE(claim.has_value());
        EXPECT_TRUE(claim->batchId.has_value());
        EXPECT_EQ(claim->items.size(), 4);
        EXPECT_EQ(queue->activeCount(), 4);
        EXPECT_EQ(queue->queuedCount(), 2);
    }

    TEST_F(TransferQueueTests, ClaimIsFifoAcrossUploadsAndDeletes)
    {
        auto queue = makeQueue();
        auto upload = queue->enqueue(makePayload("a.txt"), "").value();
        auto deletion = queue->addDeleteOperation({Ids::makeFileId("1"), Ids::makeFileId("2")});

        auto first = queue->claimNext(1);
        auto second = queue->claimNext(1);
        ASSERT_TRUE(first && second);
        EXPECT_EQ(first->items.front().record.id, upload);
        EXPECT_EQ(second->items.front().record.id, deletion);
        EXPECT_EQ(second->items.front().record.deletion()->status, SharedData::DeleteStatus::Deleting);
        EXPECT_FALSE(queue->claimNext(1).has_value());
    }

    TEST_F(TransferQueueTests, RestoreSettlesInterruptedItemsAndKeepsPlaceholdersQueued)
    {
        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(2), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        std::vector<SharedData::QueueRecord> records{
            queue->item(ids[0])->record,
            queue->item(ids[1])->record,
        };

        auto restored = makeQueue();
        restored->restore(records);
        EXPECT_EQ(statusOf(*restored, ids[0]), SharedData::UploadStatus::Failed);
        EXPECT_EQ(restored->item(ids[0])->record.error->type, SharedData::TransferErrorType::Interrupted);
        EXPECT_EQ(statusOf(*restored, ids[1]), SharedData::UploadStatus::Queued);

        auto claim = restored->claimNext(1);
        EXPECT_FALSE(claim.has_value());
        EXPECT_EQ(statusOf(*restored, ids[1]), SharedData::UploadStatus::Failed);
        EXPECT_EQ(restored->item(ids[1])->record.error->type, SharedData::TransferErrorType::PayloadUnavailable);

        auto next = restored->enqueue(makePayload("b.txt"), "").value();
        EXPECT_GT(restored->item(next)->record.sequence, records[1].sequence);
    }

    TEST_F(TransferQueueTests, ReattachedPlaceholderCanBeClaimed)
    {
        auto queue = makeQueue();
        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        auto restored = makeQueue();
        restored->restore({queue->item(id)->record});

        EXPECT_TRUE(restored->reattachPayload(id, makePayload("a.txt")));
        auto claim = restored->claimNext(1);
        ASSERT_TRUE(claim.has_value());
        EXPECT_EQ(claim->items.front().record.id, id);
    }

    TEST_F(TransferQueueTests, DetachedPlaceholdersFailWithoutAClaim)
    {
        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(2), "").value();
        auto restored = makeQueue();
        restored->restore({queue->item(ids[0])->record, queue->item(ids[1])->record});
        ASSERT_TRUE(restored->reattachPayload(ids[1], makePayload("file_1.bin")));

        restored->startSession(1);
        EXPECT_EQ(restored->failDetached(), 1);
        EXPECT_EQ(restored->failDetached(), 0);
        EXPECT_EQ(statusOf(*restored, ids[0]), SharedData::UploadStatus::Failed);
        EXPECT_EQ(restored->item(ids[0])->record.error->type, SharedData::TransferErrorType::PayloadUnavailable);
        EXPECT_EQ(statusOf(*restored, ids[1]), SharedData::UploadStatus::Queued);
        EXPECT_EQ(restored->session()->failed, 1);
    }

    TEST_F(TransferQueueTests, SingleUploadCanBeCancelled)
    {
        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(3), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        const auto deletion = queue->addDeleteOperation({Ids::makeFileId("7")});

        EXPECT_TRUE(queue->cancel(ids[0]));
        EXPECT_TRUE(queue->cancel(ids[2]));
        EXPECT_FALSE(queue->cancel(ids[2]));
        EXPECT_FALSE(queue->cancel(deletion));
        EXPECT_FALSE(queue->cancel(Ids::generateItemId()));

        EXPECT_EQ(statusOf(*queue, ids[0]), SharedData::UploadStatus::Cancelled);
        EXPECT_EQ(statusOf(*queue, ids[1]), SharedData::UploadStatus::Queued);
        EXPECT_EQ(statusOf(*queue, ids[2]), SharedData::UploadStatus::Cancelled);
        EXPECT_EQ(queue->activeCount(), 0);
        EXPECT_EQ(queue->queuedCount(), 2);
    }

    TEST_F(TransferQueueTests, DeleteProgressIsClampedToTotal)
    {
        auto queue = makeQueue();
        auto id = queue->addDeleteOperation({Ids::makeFileId("1"), Ids::makeFileId("2")});
        ASSERT_TRUE(queue->claimNext(1).has_value());

        EXPECT_TRUE(queue->updateDeleteOperation(id, {.completedFiles = 5}));
        const auto deletion = *queue->item(id)->record.deletion();
        EXPECT_EQ(deletion.completedFiles, 2);
        EXPECT_EQ(deletion.progress, 100);
        EXPECT_EQ(deletion.status, SharedData::DeleteStatus::Deleting);
    }

    TEST_F(TransferQueueTests, AcknowledgeRemovesOnlySettledItems)
    {
        auto queue = makeQueue();
        auto ids = queue->enqueueBatch(makePayloads(2), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        ASSERT_TRUE(queue->updateItem(ids[0], {.status = SharedData::UploadStatus::Completed}));

        EXPECT_CALL(*store_, removeMany(_)).WillOnce(Return(std::expected<void, Persistence::StoreError>{}));
        EXPECT_EQ(queue->acknowledge(ids), 1);
        EXPECT_EQ(queue->size(), 1);
    }

    TEST_F(TransferQueueTests, ListenerSeesActivityEdges)
    {
        auto queue = makeQueue();
        std::vector<bool> edges{};
        queue->setChangeListener([&edges](bool edge) {
            edges.push_back(edge);
        });

        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        ASSERT_TRUE(queue->updateItem(id, {.progress = 30}));
        ASSERT_TRUE(queue->updateItem(id, {.status = SharedData::UploadStatus::Completed}));

        EXPECT_EQ(edges, (std::vector<bool>{true, false, false, true}));
    }

    TEST_F(TransferQueueTests, StoreFailureDoesNotRollBack)
    {
        ON_CALL(*store_, putMany(_))
            .WillByDefault(Return(std::unexpected(
                Persistence::StoreError{.type = Persistence::StoreErrorType::WriteFailed, .message = "disk full"})));

        auto queue = makeQueue();
        EXPECT_TRUE(queue->enqueueBatch(makePayloads(2), "").has_value());
        EXPECT_EQ(queue->size(), 2);
    }

    TEST_F(TransferQueueTests, CompletedItemsAreRemovedWhenConfigured)
    {
        auto queue = makeQueue({.autoRemoveCompleted = true});
        auto id = queue->enqueue(makePayload("a.txt"), "").value();
        ASSERT_TRUE(queue->claimNext(1).has_value());
        ASSERT_TRUE(queue->updateItem(id, {.status = SharedData::UploadStatus::Completed}));
        EXPECT_FALSE(queue->item(id).has_value());
    }
}
