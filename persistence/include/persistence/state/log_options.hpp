#pragma once

#include <persistence/state_core.hpp>
#include <log/level.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct LogOptions
    {
        std::optional<Log::Level> level{std::nullopt};
        std::optional<std::string> file{std::nullopt};

        void useDefaultsFrom(LogOptions const& other);
    };
    void to_json(nlohmann::json& j, LogOptions const& options);
    void from_json(nlohmann::json const& j, LogOptions& options);
}
