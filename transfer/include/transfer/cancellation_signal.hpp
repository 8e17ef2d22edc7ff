#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace Transfer
{
    /**
     * @brief Shared cancellation flag. Copies observe the same flag, a fired signal stays fired.
     */
    class CancellationSignal
    {
      public:
        CancellationSignal();

        void cancel();
        bool isCancelled() const;

        /**
         * @brief Creates a signal that fires together with this one but can also be fired on its own.
         */
        CancellationSignal child() const;

        /**
         * @brief Sleeps for the given duration unless cancelled earlier.
         *
         * @return true if the signal was fired.
         */
        bool waitFor(std::chrono::milliseconds duration) const;

      private:
        struct State
        {
            mutable std::mutex mutex{};
            mutable std::condition_variable condition{};
            bool cancelled{false};
            std::vector<std::weak_ptr<State>> children{};
        };
        static void fire(std::shared_ptr<State> const& state);

        std::shared_ptr<State> state_;
    };
}
