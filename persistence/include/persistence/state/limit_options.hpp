#pragma once

#include <persistence/state_core.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace Persistence
{
    /**
     * @brief Validation limits applied before anything enters the queue. A value of 0 disables a limit.
     */
    struct LimitOptions
    {
        std::optional<std::uint64_t> maxFileSize{std::nullopt};
        std::optional<std::size_t> maxFiles{std::nullopt};
        std::optional<std::uint64_t> maxTotalSize{std::nullopt};
        std::optional<std::size_t> maxNameLength{std::nullopt};

        void useDefaultsFrom(LimitOptions const& other);
    };
    void to_json(nlohmann::json& j, LimitOptions const& options);
    void from_json(nlohmann::json const& j, LimitOptions& options);
}
