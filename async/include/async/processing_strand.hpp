#pragma once

#include <async/processing_thread.hpp>

#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>

namespace Async
{
    /**
     * @brief This class makes it impossible to push tasks to a strand after it has been finalized.
     * Finalization means the owner stopped listening, tasks pushed afterwards are dropped.
     */
    class ProcessingStrand
    {
      public:
        /**
         * @brief Construct a new Processing Strand object living on top of a processing thread.
         *
         * @param processingThread The processing thread to push tasks to.
         */
        ProcessingStrand(ProcessingThread* processingThread)
            : processingThread_(processingThread)
        {}

        /**
         * @brief Pushes a task, but not if the strand has been finalized.
         *
         * @return true If the task was pushed.
         * @return false If the strand has been finalized.
         */
        bool pushTask(std::function<void()> task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return false;
            return processingThread_->pushTask(std::move(task));
        }

        /**
         * @brief Pushes a task that makes any further pushes impossible.
         */
        void pushFinalTask(std::function<void()> task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return;
            finalized_ = true;
            processingThread_->pushTask(std::move(task));
        }

        /**
         * @brief Does a final task but runs it on the current calling thread.
         * Otherwise behaves like pushFinalTask.
         */
        void doFinalSync(std::function<void()> const& task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return;
            finalized_ = true;
            task();
        }

        /**
         * @brief Makes further pushes impossible without running anything.
         */
        void finalize()
        {
            std::scoped_lock lock(mutex_);
            finalized_ = true;
        }

        /**
         * @brief Pushes a task the return of which is returned for a future.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
            {
                std::promise<std::invoke_result_t<std::decay_t<Func>>> promise{};
                promise.set_exception(
                    std::make_exception_ptr(std::runtime_error("Cannot push task to finalized strand.")));
                return promise.get_future();
            }
            return processingThread_->pushPromiseTask(std::forward<Func>(func));
        }

        bool withinProcessingThread() const noexcept
        {
            return processingThread_->withinProcessingThread();
        }

        bool isFinalized() const noexcept
        {
            std::scoped_lock lock(mutex_);
            return finalized_;
        }

      private:
        mutable std::recursive_mutex mutex_{};
        bool finalized_ = false;
        ProcessingThread* processingThread_{};
    };
}
