#include <transfer/cancellation_signal.hpp>

namespace Transfer
{
    CancellationSignal::CancellationSignal()
        : state_{std::make_shared<State>()}
    {}

    void CancellationSignal::fire(std::shared_ptr<State> const& state)
    {
        std::vector<std::weak_ptr<State>> children{};
        {
            std::scoped_lock lock{state->mutex};
            if (state->cancelled)
                return;
            state->cancelled = true;
            children = std::move(state->children);
        }
        state->condition.notify_all();
        for (auto const& weakChild : children)
        {
            if (auto child = weakChild.lock(); child)
                fire(child);
        }
    }

    void CancellationSignal::cancel()
    {
        fire(state_);
    }

    bool CancellationSignal::isCancelled() const
    {
        std::scoped_lock lock{state_->mutex};
        return state_->cancelled;
    }

    CancellationSignal CancellationSignal::child() const
    {
        CancellationSignal result{};
        std::scoped_lock lock{state_->mutex};
        if (state_->cancelled)
        {
            result.state_->cancelled = true;
            return result;
        }
        std::erase_if(state_->children, [](auto const& weakChild) {
            return weakChild.expired();
        });
        state_->children.push_back(result.state_);
        return result;
    }

    bool CancellationSignal::waitFor(std::chrono::milliseconds duration) const
    {
        std::unique_lock lock{state_->mutex};
        return state_->condition.wait_for(lock, duration, [this]() {
            return state_->cancelled;
        });
    }
}
