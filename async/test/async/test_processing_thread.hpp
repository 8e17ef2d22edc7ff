#pragma once

#include <utility/awaiter.hpp>
#include <async/processing_thread.hpp>
#include <async/processing_strand.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Async::Test
{
    class ProcessingThreadTests : public ::testing::Test
    {
      protected:
        ProcessingThread processingThread_{};
    };

    TEST_F(ProcessingThreadTests, CanStartThreadAndStopIt)
    {
        processingThread_.start(1ms);
        EXPECT_TRUE(processingThread_.isRunning());
        ASSERT_NO_FATAL_FAILURE(processingThread_.stop());
        EXPECT_FALSE(processingThread_.isRunning());
    }

    TEST_F(ProcessingThreadTests, CanStartAndDestructThread)
    {
        ProcessingThread processingThread;
        processingThread.start(1ms);
    }

    TEST_F(ProcessingThreadTests, PushedTaskIsEventuallyExecuted)
    {
        Awaiter awaiter{};
        processingThread_.start(1ms);
        EXPECT_TRUE(processingThread_.pushTask([&awaiter] {
            awaiter.arrive();
        }));
        ASSERT_TRUE(awaiter.waitFor());
    }

    TEST_F(ProcessingThreadTests, TasksRunInPushOrder)
    {
        std::vector<int> order{};
        processingThread_.start(1ms);
        for (int i = 0; i < 250; ++i)
            processingThread_.pushTask([&order, i] {
                order.push_back(i);
            });
        ASSERT_TRUE(processingThread_.awaitCycle());
        ASSERT_EQ(order.size(), 250);
        for (int i = 0; i < 250; ++i)
            EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }

    TEST_F(ProcessingThreadTests, AllTasksAreExecutedEvenIfDestructed)
    {
        std::atomic_int counter = 0;
        Awaiter awaiter{};
        {
            ProcessingThread processingThread;
            processingThread.start(1ms);
            for (unsigned int i = 0; i < ProcessingThread::maximumTasksProcessableAtOnce * 3; ++i)
            {
                EXPECT_TRUE(processingThread.pushTask([&counter, &awaiter] {
                    if (counter.load() == 0)
                        awaiter.arrive();
                    ++counter;
                }));
            }
            awaiter.wait();
        }
        ASSERT_EQ(ProcessingThread::maximumTasksProcessableAtOnce * 3, counter.load());
    }

    TEST_F(ProcessingThreadTests, CannotPushTaskWhileStopping)
    {
        Awaiter awaiter{};
        processingThread_.pushTask([&] {
            awaiter.arrive();
            std::this_thread::sleep_for(100ms);
        });
        std::thread asyncStopper{[&] {
            processingThread_.stop();
        }};
        awaiter.wait();
        EXPECT_FALSE(processingThread_.pushTask([] {}));
        asyncStopper.join();
    }

    TEST_F(ProcessingThreadTests, ThrowingTaskDoesNotStopTheThread)
    {
        Awaiter awaiter{};
        processingThread_.start(1ms);
        processingThread_.pushTask([] {
            throw std::runtime_error("boom");
        });
        processingThread_.pushTask([&awaiter] {
            awaiter.arrive();
        });
        EXPECT_TRUE(awaiter.waitFor());
        EXPECT_TRUE(processingThread_.isRunning());
    }

    TEST_F(ProcessingThreadTests, PromiseTaskDeliversValue)
    {
        processingThread_.start(1ms);
        auto future = processingThread_.pushPromiseTask([] {
            return 42;
        });
        ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
        EXPECT_EQ(future.get(), 42);
    }

    TEST_F(ProcessingThreadTests, PromiseTaskForwardsExceptions)
    {
        processingThread_.start(1ms);
        auto future = processingThread_.pushPromiseTask([]() -> int {
            throw std::runtime_error("nope");
        });
        ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
        EXPECT_THROW(future.get(), std::runtime_error);
    }

    TEST_F(ProcessingThreadTests, TaskKnowsItIsWithinProcessingThread)
    {
        processingThread_.start(1ms);
        EXPECT_FALSE(processingThread_.withinProcessingThread());
        auto future = processingThread_.pushPromiseTask([this] {
            return processingThread_.withinProcessingThread();
        });
        EXPECT_TRUE(future.get());
    }

    TEST_F(ProcessingThreadTests, FinalizedStrandRejectsTasks)
    {
        processingThread_.start(1ms);
        auto strand = processingThread_.createStrand();
        EXPECT_TRUE(strand->pushTask([] {}));
        strand->finalize();
        EXPECT_TRUE(strand->isFinalized());
        EXPECT_FALSE(strand->pushTask([] {}));
    }

    TEST_F(ProcessingThreadTests, FinalTaskStillRunsButNothingAfter)
    {
        std::atomic_int counter = 0;
        processingThread_.start(1ms);
        auto strand = processingThread_.createStrand();
        strand->pushFinalTask([&counter] {
            ++counter;
        });
        EXPECT_FALSE(strand->pushTask([&counter] {
            ++counter;
        }));
        ASSERT_TRUE(processingThread_.awaitCycle());
        EXPECT_EQ(counter.load(), 1);
    }

    TEST_F(ProcessingThreadTests, PromiseTaskOnFinalizedStrandFails)
    {
        processingThread_.start(1ms);
        auto strand = processingThread_.createStrand();
        strand->doFinalSync([] {});
        auto future = strand->pushPromiseTask([] {
            return 1;
        });
        EXPECT_THROW(future.get(), std::runtime_error);
    }
}
