#pragma once

#include <persistence/state_core.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace Persistence
{
    struct QueueOptions
    {
        std::optional<bool> autoRemoveCompleted{std::nullopt};
        std::optional<std::size_t> maxRetainedItems{std::nullopt};
        std::optional<std::string> journalPath{std::nullopt};
        std::optional<std::size_t> compactionFactor{std::nullopt};

        void useDefaultsFrom(QueueOptions const& other);
    };
    void to_json(nlohmann::json& j, QueueOptions const& options);
    void from_json(nlohmann::json const& j, QueueOptions& options);
}
