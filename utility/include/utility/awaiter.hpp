#pragma once

#include <atomic>
#include <chrono>
#include <future>

/**
 * @brief Test helper: becomes ready after maxCount arrivals. Extra arrivals are counted but ignored.
 */
class Awaiter
{
  public:
    Awaiter(int maxCount = 1)
        : maxCount_(maxCount)
    {}

    bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1})
    {
        return ready_.wait_for(duration) == std::future_status::ready;
    }

    void wait()
    {
        ready_.wait();
    }

    void reset()
    {
        counter_ = 0;
        promise_ = std::promise<void>{};
        ready_ = promise_.get_future().share();
    }

    void arrive()
    {
        if (++counter_ == maxCount_)
            promise_.set_value();
    }

    int arrivals() const
    {
        return counter_.load();
    }

  private:
    const int maxCount_{0};
    std::atomic_int counter_ = 0;
    std::promise<void> promise_{};
    std::shared_future<void> ready_{promise_.get_future().share()};
};
