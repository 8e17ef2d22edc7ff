#include <async/processing_thread.hpp>
#include <async/processing_strand.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace Async
{
    ProcessingThread::ProcessingThread()
    {}
    ProcessingThread::~ProcessingThread()
    {
        stop();
    }
    bool ProcessingThread::isRunning() const
    {
        std::lock_guard lock{taskMutex_};
        return running_;
    }
    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        {
            std::lock_guard lock{taskMutex_};
            if (running_)
                return;
            running_ = true;
        }
        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        auto started = awaitThreadStart.get_future();
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        started.wait();
    }
    void ProcessingThread::stop()
    {
        shuttingDown_ = true;
        {
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
        taskCondition_.notify_all();

        if (withinProcessingThread())
        {
            Log::error("ProcessingThread: stop called from within the processing thread, cannot join.");
            return;
        }
        if (thread_.joinable())
            thread_.join();

        // execute all pending tasks:
        std::deque<std::function<void()>> remaining{};
        {
            std::lock_guard lock{taskMutex_};
            remaining = std::move(tasks_);
            tasks_.clear();
        }
        for (auto const& task : remaining)
            runTask(task);
        shuttingDown_ = false;
    }
    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task)
            throw std::invalid_argument("Task must not be empty.");

        if (shuttingDown_)
            return false;

        {
            std::lock_guard lock{taskMutex_};
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }
    std::unique_ptr<ProcessingStrand> ProcessingThread::createStrand()
    {
        return std::make_unique<ProcessingStrand>(this);
    }
    std::size_t ProcessingThread::pendingTaskCount() const
    {
        std::lock_guard lock{taskMutex_};
        return tasks_.size();
    }
    void ProcessingThread::runTask(std::function<void()> const& task)
    {
        try
        {
            task();
        }
        catch (std::exception const& e)
        {
            Log::error("ProcessingThread: Task threw an exception: {}", e.what());
        }
    }
    void ProcessingThread::run(std::chrono::milliseconds const& waitCycleTimeout)
    {
        while (true)
        {
            std::vector<std::function<void()>> tasks{};
            {
                std::unique_lock lock{taskMutex_};
                taskCondition_.wait_for(lock, waitCycleTimeout, [this]() {
                    return !tasks_.empty() || !running_;
                });
                if (!running_)
                    break;
                if (tasks_.empty())
                    continue;

                const auto count = std::min<std::size_t>(tasks_.size(), maximumTasksProcessableAtOnce);
                tasks.reserve(count);
                std::move(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(tasks));
                tasks_.erase(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count));
            }

            for (auto const& task : tasks)
                runTask(task);
        }
    }
    bool ProcessingThread::awaitCycle(std::chrono::milliseconds maxWait)
    {
        if (!withinProcessingThread() && isRunning())
        {
            return pushPromiseTask([]() {
                       return true;
                   }).wait_for(maxWait) == std::future_status::ready;
        }
        return false;
    }
}
