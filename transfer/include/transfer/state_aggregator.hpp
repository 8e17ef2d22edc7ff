#pragma once

#include <shared_data/transfer/queue_snapshot.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace Transfer
{
    /**
     * @brief Publishes queue snapshots to subscribers, at most once per throttle window.
     * A publish request inside the window arms a single trailing timer. Callbacks run on the aggregator thread.
     */
    class StateAggregator
    {
      public:
        using SnapshotSource = std::function<SharedData::QueueSnapshot()>;
        using Subscriber = std::function<void(SharedData::QueueSnapshot const&)>;
        using Unsubscribe = std::function<void()>;

        constexpr static std::chrono::milliseconds defaultWindow{200};
        constexpr static std::chrono::milliseconds minimumWindow{150};
        constexpr static std::chrono::milliseconds maximumWindow{500};

        explicit StateAggregator(SnapshotSource source, std::chrono::milliseconds window = defaultWindow);
        ~StateAggregator();
        StateAggregator(StateAggregator const&) = delete;
        StateAggregator& operator=(StateAggregator const&) = delete;
        StateAggregator(StateAggregator&&) = delete;
        StateAggregator& operator=(StateAggregator&&) = delete;

        void start();
        void stop();

        /**
         * @brief Publishes now if the window elapsed since the last publish, otherwise at the end of the window.
         */
        void schedulePublish();

        /**
         * @brief Publishes without waiting for the window. A pending trailing publish is dropped.
         */
        void publishNow();

        /**
         * @brief Registers a subscriber. It receives the current snapshot right away and then every publish.
         *
         * @return Removes the subscriber when called. Safe to call after the aggregator is gone.
         */
        Unsubscribe subscribe(Subscriber subscriber);

        std::chrono::milliseconds window() const
        {
            return window_;
        }

        std::size_t publishCount() const
        {
            return publishCount_.load();
        }

        std::size_t subscriberCount() const;

      private:
        struct Subscribers
        {
            std::mutex mutex{};
            std::map<std::uint64_t, Subscriber> callbacks{};
            std::uint64_t nextId{0};
        };

        void publish();
        void deliver(SharedData::QueueSnapshot const& snapshot, std::uint64_t id, Subscriber const& subscriber);

      private:
        SnapshotSource source_;
        std::chrono::milliseconds window_;
        std::shared_ptr<Subscribers> subscribers_;

        boost::asio::io_context context_{};
        std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_{};
        boost::asio::steady_timer trailingTimer_;
        std::thread thread_{};

        // Aggregator thread only:
        std::chrono::steady_clock::time_point lastPublish_{};
        bool trailingArmed_{false};

        std::atomic_size_t publishCount_{0};
    };
}
