#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    void RetryOptions::useDefaultsFrom(RetryOptions const& other)
    {
        if (!maxAttempts)
            maxAttempts = other.maxAttempts;
        if (!backoffMilliseconds)
            backoffMilliseconds = other.backoffMilliseconds;
    }
    void to_json(nlohmann::json& j, RetryOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, maxAttempts);
        TO_JSON_OPTIONAL(j, options, backoffMilliseconds);
    }
    void from_json(nlohmann::json const& j, RetryOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, maxAttempts);
        FROM_JSON_OPTIONAL(j, options, backoffMilliseconds);
    }

    void TimeoutOptions::useDefaultsFrom(TimeoutOptions const& other)
    {
        if (!baseSeconds)
            baseSeconds = other.baseSeconds;
        if (!perMegabyteMilliseconds)
            perMegabyteMilliseconds = other.perMegabyteMilliseconds;
    }
    void to_json(nlohmann::json& j, TimeoutOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, baseSeconds);
        TO_JSON_OPTIONAL(j, options, perMegabyteMilliseconds);
    }
    void from_json(nlohmann::json const& j, TimeoutOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, baseSeconds);
        FROM_JSON_OPTIONAL(j, options, perMegabyteMilliseconds);
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        if (!concurrency)
            concurrency = other.concurrency;
        if (!shardThreshold)
            shardThreshold = other.shardThreshold;
        if (!shardSize)
            shardSize = other.shardSize;
        if (!workerCount)
            workerCount = other.workerCount;
        if (!negotiationChunkSize)
            negotiationChunkSize = other.negotiationChunkSize;
        if (!deleteChunkSize)
            deleteChunkSize = other.deleteChunkSize;
        if (!throttleWindowMilliseconds)
            throttleWindowMilliseconds = other.throttleWindowMilliseconds;
        if (!cancelGracePeriodMilliseconds)
            cancelGracePeriodMilliseconds = other.cancelGracePeriodMilliseconds;

        if (!retry)
            retry = other.retry;
        else if (other.retry)
            retry->useDefaultsFrom(*other.retry);

        if (!timeouts)
            timeouts = other.timeouts;
        else if (other.timeouts)
            timeouts->useDefaultsFrom(*other.timeouts);
    }
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, concurrency);
        TO_JSON_OPTIONAL(j, options, shardThreshold);
        TO_JSON_OPTIONAL(j, options, shardSize);
        TO_JSON_OPTIONAL(j, options, workerCount);
        TO_JSON_OPTIONAL(j, options, negotiationChunkSize);
        TO_JSON_OPTIONAL(j, options, deleteChunkSize);
        TO_JSON_OPTIONAL(j, options, throttleWindowMilliseconds);
        TO_JSON_OPTIONAL(j, options, cancelGracePeriodMilliseconds);
        TO_JSON_OPTIONAL(j, options, retry);
        TO_JSON_OPTIONAL(j, options, timeouts);
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, concurrency);
        FROM_JSON_OPTIONAL(j, options, shardThreshold);
        FROM_JSON_OPTIONAL(j, options, shardSize);
        FROM_JSON_OPTIONAL(j, options, workerCount);
        FROM_JSON_OPTIONAL(j, options, negotiationChunkSize);
        FROM_JSON_OPTIONAL(j, options, deleteChunkSize);
        FROM_JSON_OPTIONAL(j, options, throttleWindowMilliseconds);
        FROM_JSON_OPTIONAL(j, options, cancelGracePeriodMilliseconds);
        FROM_JSON_OPTIONAL(j, options, retry);
        FROM_JSON_OPTIONAL(j, options, timeouts);
    }
}
