#pragma once

#include <persistence/state_core.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct BackendOptions
    {
        std::optional<std::string> baseUrl{std::nullopt};
        std::optional<std::string> token{std::nullopt};
        std::optional<int> timeoutSeconds{std::nullopt};
        std::optional<std::string> negotiatePath{std::nullopt};
        std::optional<std::string> commitPath{std::nullopt};
        std::optional<std::string> deletePath{std::nullopt};

        void useDefaultsFrom(BackendOptions const& other);
    };
    void to_json(nlohmann::json& j, BackendOptions const& options);
    void from_json(nlohmann::json const& j, BackendOptions& options);
}
