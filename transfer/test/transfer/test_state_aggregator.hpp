#pragma once

#include <transfer/state_aggregator.hpp>
#include <utility/awaiter.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace Transfer::Test
{
    class StateAggregatorTests : public ::testing::Test
    {
      protected:
        std::unique_ptr<StateAggregator> makeAggregator(std::chrono::milliseconds window = 200ms)
        {
            auto aggregator = std::make_unique<StateAggregator>(
                [this]() {
                    return SharedData::QueueSnapshot{.total = total_.load()};
                },
                window);
            aggregator->start();
            return aggregator;
        }

      protected:
        std::atomic_size_t total_{7};
    };

    TEST_F(StateAggregatorTests, NewSubscriberReceivesTheCurrentSnapshot)
    {
        auto aggregator = makeAggregator();
        Awaiter awaiter{};
        std::size_t received = 0;
        auto unsubscribe = aggregator->subscribe([&](SharedData::QueueSnapshot const& snapshot) {
            received = snapshot.total;
            awaiter.arrive();
        });

        ASSERT_TRUE(awaiter.waitFor());
        EXPECT_EQ(received, 7);
        EXPECT_EQ(aggregator->publishCount(), 0);
    }

    TEST_F(StateAggregatorTests, BurstIsCoalescedIntoLeadingAndTrailingPublish)
    {
        auto aggregator = makeAggregator(200ms);
        std::atomic_int deliveries{0};
        std::atomic_size_t lastTotal{0};
        auto unsubscribe = aggregator->subscribe([&](SharedData::QueueSnapshot const& snapshot) {
            lastTotal = snapshot.total;
            ++deliveries;
        });

        for (std::size_t i = 0; i != 50; ++i)
        {
            total_ = i;
            aggregator->schedulePublish();
        }
        std::this_thread::sleep_for(450ms);

        EXPECT_EQ(aggregator->publishCount(), 2);
        EXPECT_EQ(deliveries.load(), 3);
        EXPECT_EQ(lastTotal.load(), 49);
    }

    TEST_F(StateAggregatorTests, PublishNowReplacesThePendingTrailingPublish)
    {
        auto aggregator = makeAggregator(300ms);
        aggregator->schedulePublish();
        aggregator->schedulePublish();
        aggregator->publishNow();
        std::this_thread::sleep_for(500ms);

        EXPECT_EQ(aggregator->publishCount(), 2);
    }

    TEST_F(StateAggregatorTests, WindowIsClampedToTheSupportedRange)
    {
        EXPECT_EQ(StateAggregator([]() { return SharedData::QueueSnapshot{}; }, 10ms).window(), 150ms);
        EXPECT_EQ(StateAggregator([]() { return SharedData::QueueSnapshot{}; }, 2s).window(), 500ms);
        EXPECT_EQ(StateAggregator([]() { return SharedData::QueueSnapshot{}; }, 250ms).window(), 250ms);
    }

    TEST_F(StateAggregatorTests, ThrowingSubscriberDoesNotAffectOthers)
    {
        auto aggregator = makeAggregator();
        Awaiter awaiter{2};
        auto first = aggregator->subscribe([](SharedData::QueueSnapshot const&) {
            throw std::runtime_error{"observer broke"};
        });
        auto second = aggregator->subscribe([&awaiter](SharedData::QueueSnapshot const&) {
            awaiter.arrive();
        });

        aggregator->publishNow();
        EXPECT_TRUE(awaiter.waitFor());
    }

    TEST_F(StateAggregatorTests, UnsubscribedCallbackIsNotCalledAnymore)
    {
        auto aggregator = makeAggregator();
        std::atomic_int deliveries{0};
        auto unsubscribe = aggregator->subscribe([&deliveries](SharedData::QueueSnapshot const&) {
            ++deliveries;
        });
        std::this_thread::sleep_for(50ms);
        unsubscribe();
        EXPECT_EQ(aggregator->subscriberCount(), 0);

        aggregator->publishNow();
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(deliveries.load(), 1);

        aggregator.reset();
        unsubscribe();
    }
}
