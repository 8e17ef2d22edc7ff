#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <cstddef>
#include <optional>

namespace Persistence
{
    struct RetryOptions
    {
        std::optional<int> maxAttempts{std::nullopt};
        std::optional<int> backoffMilliseconds{std::nullopt};

        void useDefaultsFrom(RetryOptions const& other);
    };
    void to_json(nlohmann::json& j, RetryOptions const& options);
    void from_json(nlohmann::json const& j, RetryOptions& options);

    /**
     * @brief Per step timeout: base + perMegabyte * size in MiB.
     */
    struct TimeoutOptions
    {
        std::optional<int> baseSeconds{std::nullopt};
        std::optional<int> perMegabyteMilliseconds{std::nullopt};

        void useDefaultsFrom(TimeoutOptions const& other);
    };
    void to_json(nlohmann::json& j, TimeoutOptions const& options);
    void from_json(nlohmann::json const& j, TimeoutOptions& options);

    struct TransferOptions
    {
        std::optional<int> concurrency{std::nullopt}; // How many parallel transfers are allowed?
        std::optional<std::size_t> shardThreshold{std::nullopt};
        std::optional<std::size_t> shardSize{std::nullopt};
        std::optional<int> workerCount{std::nullopt};
        std::optional<std::size_t> negotiationChunkSize{std::nullopt};
        std::optional<std::size_t> deleteChunkSize{std::nullopt};
        std::optional<int> throttleWindowMilliseconds{std::nullopt};
        std::optional<int> cancelGracePeriodMilliseconds{std::nullopt};
        std::optional<RetryOptions> retry{std::nullopt};
        std::optional<TimeoutOptions> timeouts{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
