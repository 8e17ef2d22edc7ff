#pragma once

#include "helpers.hpp"

#include <transfer/scheduler.hpp>
#include <transfer/mocks/backend_api_mock.hpp>
#include <persistence/mocks/queue_store_mock.hpp>
#include <utility/enum_string_convert.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace Transfer::Test
{
    class SchedulerTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            ON_CALL(*backend_, negotiateDestinations(::testing::_)).WillByDefault([this](auto const& requests) {
                {
                    std::scoped_lock lock{negotiationMutex_};
                    negotiationSizes_.push_back(requests.size());
                }
                return destinationsFor(requests, nextFileId_);
            });
        }

        void TearDown() override
        {
            if (scheduler_)
                scheduler_->stop();
        }

        void makeScheduler(
            std::shared_ptr<IObjectStore> objectStore,
            Scheduler::Options options,
            TransferQueue::Options queueOptions = {})
        {
            queue_ = std::make_shared<TransferQueue>(store_, queueOptions);
            scheduler_ = std::make_shared<Scheduler>(
                queue_,
                std::make_shared<NegotiationClient>(
                    backend_, NegotiationClient::Options{.retry = RetryPolicy{.maxAttempts = 1}}),
                std::move(objectStore),
                options);
            scheduler_->start();
        }

        std::size_t countStatus(SharedData::UploadStatus status) const
        {
            const auto snapshot = queue_->snapshot();
            return static_cast<std::size_t>(
                std::count_if(snapshot.items.begin(), snapshot.items.end(), [status](auto const& view) {
                    return view.status == Utility::enumToString(status);
                }));
        }

      protected:
        std::shared_ptr<::testing::NiceMock<Persistence::Test::QueueStoreMock>> store_{
            std::make_shared<::testing::NiceMock<Persistence::Test::QueueStoreMock>>()};
        std::shared_ptr<::testing::NiceMock<BackendApiMock>> backend_{
            std::make_shared<::testing::NiceMock<BackendApiMock>>()};
        std::atomic_int nextFileId_{1};
        std::mutex negotiationMutex_{};
        std::vector<std::size_t> negotiationSizes_{};
        std::shared_ptr<TransferQueue> queue_{};
        std::shared_ptr<Scheduler> scheduler_{};
    };

    TEST_F(SchedulerTests, NeverExceedsTheConcurrencyLimit)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(50ms);
        makeScheduler(objectStore, Scheduler::Options{.concurrency = 2});

        ASSERT_TRUE(queue_->enqueue(makePayload("small.bin", 1024), "").has_value());
        ASSERT_TRUE(queue_->enqueue(makePayload("large.bin", 2 * 1024 * 1024), "").has_value());
        ASSERT_TRUE(queue_->enqueue(makePayload("medium.bin", 500 * 1024), "").has_value());
        scheduler_->wake();

        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 3;
        }));
        EXPECT_EQ(objectStore->peak(), 2);
        EXPECT_EQ(objectStore->calls(), 3);
        EXPECT_LE(scheduler_->peakActiveCount(), 2);
    }

    TEST_F(SchedulerTests, ItemsStartInEnqueueOrder)
    {
        std::mutex mutex{};
        std::vector<std::string> started{};
        ON_CALL(*backend_, negotiateDestinations(::testing::_)).WillByDefault([&](auto const& requests) {
            {
                std::scoped_lock lock{mutex};
                started.push_back(requests.front().filename);
            }
            return destinationsFor(requests, nextFileId_);
        });

        makeScheduler(std::make_shared<SlowObjectStore>(1ms), Scheduler::Options{.concurrency = 1});
        for (auto const& name : {"a.txt", "b.txt", "c.txt"})
            ASSERT_TRUE(queue_->enqueue(makePayload(name), "").has_value());
        scheduler_->wake();

        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 3;
        }));
        std::scoped_lock lock{mutex};
        EXPECT_EQ(started, (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));
    }

    TEST_F(SchedulerTests, CancelAllFreesTheSlotsImmediately)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(3s);
        makeScheduler(objectStore, Scheduler::Options{.concurrency = 2});

        ASSERT_TRUE(queue_->enqueueBatch(makePayloads(4), "").has_value());
        scheduler_->wake();
        ASSERT_TRUE(eventually([this]() {
            return queue_->activeCount() == 2;
        }));

        EXPECT_EQ(queue_->cancelAll(), 4);
        scheduler_->cancelAll();
        EXPECT_EQ(countStatus(SharedData::UploadStatus::Cancelled), 4);

        auto next = queue_->enqueue(makePayload("after.txt"), "");
        ASSERT_TRUE(next.has_value());
        scheduler_->wake();
        EXPECT_TRUE(eventually(
            [this, id = *next]() {
                return queue_->item(id)->record.upload()->status == SharedData::UploadStatus::Uploading;
            },
            1s));
        EXPECT_EQ(countStatus(SharedData::UploadStatus::Cancelled), 4);
    }

    TEST_F(SchedulerTests, LargeBatchIsNegotiatedInShards)
    {
        EXPECT_CALL(*backend_, commitCompletion(::testing::_)).Times(::testing::AtLeast(3));

        makeScheduler(
            std::make_shared<SlowObjectStore>(5ms),
            Scheduler::Options{
                .concurrency = 10,
                .shardSize = 5,
                .workers = WorkerPool::Options{.workerCount = 2},
            },
            TransferQueue::Options{.shardThreshold = 10});

        ASSERT_TRUE(queue_->enqueueBatch(makePayloads(12), "").has_value());
        scheduler_->wake();

        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 12;
        }));

        std::scoped_lock lock{negotiationMutex_};
        std::size_t negotiated = 0;
        for (auto size : negotiationSizes_)
            negotiated += size;
        EXPECT_EQ(negotiated, 12);
        EXPECT_EQ(*std::max_element(negotiationSizes_.begin(), negotiationSizes_.end()), 5);
    }

    TEST_F(SchedulerTests, ShardItemsAreTransferredInParallel)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(200ms);
        makeScheduler(
            objectStore,
            Scheduler::Options{
                .concurrency = 8,
                .shardSize = 8,
                .workers = WorkerPool::Options{.workerCount = 1},
            },
            TransferQueue::Options{.shardThreshold = 8});

        ASSERT_TRUE(queue_->enqueueBatch(makePayloads(8), "").has_value());
        const auto start = std::chrono::steady_clock::now();
        scheduler_->wake();

        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 8;
        }));
        EXPECT_GT(objectStore->peak(), 1);
        EXPECT_EQ(objectStore->peak(), 8);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 1200ms);
        EXPECT_EQ(objectStore->calls(), 8);
    }

    TEST_F(SchedulerTests, ShardConcurrencyShrinksForLargeFiles)
    {
        const auto items = [](std::size_t count, std::uint64_t size) {
            std::vector<QueueItem> result(count);
            for (auto& item : result)
                item.record.body = SharedData::UploadRecord{.size = size};
            return result;
        };
        constexpr std::uint64_t megabyte = 1024 * 1024;

        EXPECT_EQ(shardConcurrency({}), 1);
        EXPECT_EQ(shardConcurrency(items(3, 1024)), 3);
        EXPECT_EQ(shardConcurrency(items(50, 1024)), 24);
        EXPECT_EQ(shardConcurrency(items(50, 10 * megabyte)), 16);
        EXPECT_EQ(shardConcurrency(items(50, 30 * megabyte)), 12);
        EXPECT_EQ(shardConcurrency(items(50, 200 * megabyte)), 6);
    }

    TEST_F(SchedulerTests, SingleShardItemCanBeCancelled)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(300ms);
        makeScheduler(
            objectStore,
            Scheduler::Options{
                .concurrency = 4,
                .shardSize = 4,
                .workers = WorkerPool::Options{.workerCount = 1},
            },
            TransferQueue::Options{.shardThreshold = 4});

        auto ids = queue_->enqueueBatch(makePayloads(4), "");
        ASSERT_TRUE(ids.has_value());
        scheduler_->wake();
        ASSERT_TRUE(eventually([&objectStore]() {
            return objectStore->peak() == 4;
        }));

        const auto target = ids->at(1);
        EXPECT_TRUE(scheduler_->cancel(target, [this, &target]() {
            queue_->cancel(target);
        }));

        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 3;
        }));
        EXPECT_EQ(queue_->item(target)->record.upload()->status, SharedData::UploadStatus::Cancelled);
        EXPECT_TRUE(eventually([this]() {
            return scheduler_->activeCount() == 0;
        }));
    }

    TEST_F(SchedulerTests, PausedSchedulerClaimsNothing)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(1ms);
        makeScheduler(objectStore, Scheduler::Options{.concurrency = 2});
        scheduler_->pause();
        EXPECT_TRUE(scheduler_->isPaused());

        ASSERT_TRUE(queue_->enqueue(makePayload("waiting.txt"), "").has_value());
        scheduler_->wake();
        std::this_thread::sleep_for(100ms);
        EXPECT_EQ(queue_->queuedCount(), 1);
        EXPECT_EQ(objectStore->calls(), 0);

        scheduler_->resume();
        ASSERT_TRUE(eventually([this]() {
            return countStatus(SharedData::UploadStatus::Completed) == 1;
        }));
    }

    TEST_F(SchedulerTests, StuckWorkerIsReplaced)
    {
        auto objectStore = std::make_shared<SlowObjectStore>(600ms, false);
        makeScheduler(
            objectStore,
            Scheduler::Options{
                .concurrency = 4,
                .shardSize = 2,
                .workers = WorkerPool::Options{.workerCount = 1, .cancelGracePeriod = 20ms},
            },
            TransferQueue::Options{.shardThreshold = 2});

        ASSERT_TRUE(queue_->enqueueBatch(makePayloads(2), "").has_value());
        scheduler_->wake();
        ASSERT_TRUE(eventually([&objectStore]() {
            return objectStore->peak() >= 1;
        }));

        queue_->cancelAll();
        scheduler_->cancelAll();

        auto next = queue_->enqueueBatch(makePayloads(2), "");
        ASSERT_TRUE(next.has_value());
        scheduler_->wake();
        ASSERT_TRUE(eventually([this, ids = *next]() {
            return queue_->item(ids.front())->record.upload()->status == SharedData::UploadStatus::Completed &&
                queue_->item(ids.back())->record.upload()->status == SharedData::UploadStatus::Completed;
        }));
        EXPECT_EQ(countStatus(SharedData::UploadStatus::Cancelled), 2);
    }

    TEST_F(SchedulerTests, DeleteOperationRunsOnThePool)
    {
        EXPECT_CALL(*backend_, bulkDelete(::testing::_)).Times(2).WillRepeatedly([](auto const& ids) {
            return SharedData::BulkDeleteResult{.successCount = ids.size()};
        });

        makeScheduler(std::make_shared<SlowObjectStore>(1ms), Scheduler::Options{.concurrency = 2});
        std::vector<Ids::FileId> targets{};
        for (int i = 0; i != 1500; ++i)
            targets.push_back(Ids::makeFileId(std::to_string(i + 1)));
        const auto id = queue_->addDeleteOperation(std::move(targets));
        scheduler_->wake();

        ASSERT_TRUE(eventually([this, id]() {
            return queue_->item(id)->record.deletion()->status == SharedData::DeleteStatus::Completed;
        }));
        EXPECT_EQ(queue_->item(id)->record.deletion()->completedFiles, 1500);
        EXPECT_TRUE(eventually([this]() {
            return scheduler_->activeCount() == 0;
        }));
    }
}
