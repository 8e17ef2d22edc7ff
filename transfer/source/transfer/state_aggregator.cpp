#include <transfer/state_aggregator.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <vector>

namespace Transfer
{
    StateAggregator::StateAggregator(SnapshotSource source, std::chrono::milliseconds window)
        : source_{std::move(source)}
        , window_{std::clamp(window, minimumWindow, maximumWindow)}
        , subscribers_{std::make_shared<Subscribers>()}
        , trailingTimer_{context_}
    {
        if (window_ != window)
            Log::warn("StateAggregator: Throttle window {} ms clamped to {} ms.", window.count(), window_.count());
    }

    StateAggregator::~StateAggregator()
    {
        stop();
    }

    void StateAggregator::start()
    {
        if (thread_.joinable())
            return;

        context_.restart();
        workGuard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            context_.get_executor());
        thread_ = std::thread{[this]() {
            context_.run();
        }};
        Log::debug("StateAggregator: Started with a window of {} ms.", window_.count());
    }

    void StateAggregator::stop()
    {
        if (!thread_.joinable())
            return;

        boost::asio::post(context_, [this]() {
            trailingTimer_.cancel();
            trailingArmed_ = false;
        });
        workGuard_.reset();
        thread_.join();
        Log::debug("StateAggregator: Stopped after {} publishes.", publishCount_.load());
    }

    void StateAggregator::schedulePublish()
    {
        boost::asio::post(context_, [this]() {
            if (trailingArmed_)
                return;

            const auto now = std::chrono::steady_clock::now();
            if (now - lastPublish_ >= window_)
            {
                publish();
                return;
            }

            trailingArmed_ = true;
            trailingTimer_.expires_at(lastPublish_ + window_);
            trailingTimer_.async_wait([this](boost::system::error_code const& ec) {
                if (ec)
                    return;
                trailingArmed_ = false;
                publish();
            });
        });
    }

    void StateAggregator::publishNow()
    {
        boost::asio::post(context_, [this]() {
            if (trailingArmed_)
            {
                trailingTimer_.cancel();
                trailingArmed_ = false;
            }
            publish();
        });
    }

    StateAggregator::Unsubscribe StateAggregator::subscribe(Subscriber subscriber)
    {
        std::uint64_t id = 0;
        {
            std::scoped_lock lock{subscribers_->mutex};
            id = subscribers_->nextId++;
            subscribers_->callbacks.emplace(id, std::move(subscriber));
        }

        boost::asio::post(context_, [this, id]() {
            Subscriber subscriber{};
            {
                std::scoped_lock lock{subscribers_->mutex};
                auto iter = subscribers_->callbacks.find(id);
                if (iter == subscribers_->callbacks.end())
                    return;
                subscriber = iter->second;
            }
            deliver(source_(), id, subscriber);
        });

        return [weak = std::weak_ptr<Subscribers>{subscribers_}, id]() {
            if (auto subscribers = weak.lock(); subscribers)
            {
                std::scoped_lock lock{subscribers->mutex};
                subscribers->callbacks.erase(id);
            }
        };
    }

    std::size_t StateAggregator::subscriberCount() const
    {
        std::scoped_lock lock{subscribers_->mutex};
        return subscribers_->callbacks.size();
    }

    void StateAggregator::publish()
    {
        lastPublish_ = std::chrono::steady_clock::now();
        ++publishCount_;

        const auto snapshot = source_();
        std::vector<std::pair<std::uint64_t, Subscriber>> callbacks{};
        {
            std::scoped_lock lock{subscribers_->mutex};
            callbacks.assign(subscribers_->callbacks.begin(), subscribers_->callbacks.end());
        }
        for (auto const& [id, subscriber] : callbacks)
            deliver(snapshot, id, subscriber);
    }

    void StateAggregator::deliver(SharedData::QueueSnapshot const& snapshot, std::uint64_t id, Subscriber const& subscriber)
    {
        try
        {
            subscriber(snapshot);
        }
        catch (std::exception const& exc)
        {
            Log::error("StateAggregator: Subscriber {} threw: {}", id, exc.what());
        }
    }
}
