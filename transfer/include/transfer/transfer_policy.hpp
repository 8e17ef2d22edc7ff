#pragma once

#include <transfer/cancellation_signal.hpp>
#include <log/log.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace Transfer
{
    struct RetryPolicy
    {
        int maxAttempts{3};
        std::chrono::milliseconds backoff{500};
    };

    /**
     * @brief Per step timeout: base + perMegabyte * size in MiB.
     */
    struct TimeoutPolicy
    {
        std::chrono::milliseconds base{std::chrono::seconds{30}};
        std::chrono::milliseconds perMegabyte{2000};

        std::chrono::milliseconds timeoutFor(std::uint64_t bytes) const
        {
            constexpr std::uint64_t mebibyte = 1024 * 1024;
            return base + perMegabyte * static_cast<std::int64_t>((bytes + mebibyte - 1) / mebibyte);
        }
    };

    /**
     * @brief Calls func until it succeeds, fails with a non transient error or the attempts are used up.
     * The backoff between attempts ends early when the signal is fired, the last result is returned then.
     */
    template <typename FunctionT>
    auto withRetry(RetryPolicy const& policy, CancellationSignal const& cancel, std::string_view what, FunctionT&& func)
        -> std::invoke_result_t<FunctionT&>
    {
        auto result = func();
        for (int attempt = 1; attempt < policy.maxAttempts && !result.has_value() && result.error().isTransient();
             ++attempt)
        {
            Log::warn(
                "Retry: {} failed on attempt {}/{}: {}",
                what,
                attempt,
                policy.maxAttempts,
                result.error().toString());
            if (cancel.waitFor(policy.backoff))
                break;
            result = func();
        }
        return result;
    }
}
