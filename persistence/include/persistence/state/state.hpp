#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/backend_options.hpp>
#include <persistence/state/limit_options.hpp>
#include <persistence/state/log_options.hpp>
#include <persistence/state/queue_options.hpp>
#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    /**
     * @brief Everything the configuration file holds. All leaves are optional,
     * useDefaultsFrom(State::defaults()) yields a fully populated state.
     */
    struct State
    {
        TransferOptions transfer{};
        QueueOptions queue{};
        LimitOptions limits{};
        BackendOptions backend{};
        LogOptions log{};

        static State defaults();

        void useDefaultsFrom(State const& other);
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
