#include <persistence/state/state.hpp>

namespace Persistence
{
    State State::defaults()
    {
        return State{
            .transfer =
                TransferOptions{
                    .concurrency = 24,
                    .shardThreshold = 100,
                    .shardSize = 50,
                    .workerCount = 4,
                    .negotiationChunkSize = 1000,
                    .deleteChunkSize = 1000,
                    .throttleWindowMilliseconds = 200,
                    .cancelGracePeriodMilliseconds = 100,
                    .retry = RetryOptions{.maxAttempts = 3, .backoffMilliseconds = 500},
                    .timeouts = TimeoutOptions{.baseSeconds = 30, .perMegabyteMilliseconds = 2000},
                },
            .queue =
                QueueOptions{
                    .autoRemoveCompleted = false,
                    .maxRetainedItems = 10'000,
                    .journalPath = "~/.vaultline/queue.journal",
                    .compactionFactor = 4,
                },
            .limits =
                LimitOptions{
                    .maxFileSize = 5ULL * 1024 * 1024 * 1024,
                    .maxFiles = 100'000,
                    .maxTotalSize = 15ULL * 1024 * 1024 * 1024,
                    .maxNameLength = 255,
                },
            .backend =
                BackendOptions{
                    .baseUrl = "http://localhost:8000/api",
                    .token = std::nullopt,
                    .timeoutSeconds = 300,
                    .negotiatePath = "/media-files/get_presigned_urls/",
                    .commitPath = "/uppy/upload-complete/",
                    .deletePath = "/media-files/bulk_delete/",
                },
            .log =
                LogOptions{
                    .level = Log::Level::Info,
                    .file = std::nullopt,
                },
        };
    }

    void State::useDefaultsFrom(State const& other)
    {
        transfer.useDefaultsFrom(other.transfer);
        queue.useDefaultsFrom(other.queue);
        limits.useDefaultsFrom(other.limits);
        backend.useDefaultsFrom(other.backend);
        log.useDefaultsFrom(other.log);
    }

    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["transfer"] = state.transfer;
        j["queue"] = state.queue;
        j["limits"] = state.limits;
        j["backend"] = state.backend;
        j["log"] = state.log;
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("transfer"))
            j.at("transfer").get_to(state.transfer);

        if (j.contains("queue"))
            j.at("queue").get_to(state.queue);

        if (j.contains("limits"))
            j.at("limits").get_to(state.limits);

        if (j.contains("backend"))
            j.at("backend").get_to(state.backend);

        if (j.contains("log"))
            j.at("log").get_to(state.log);
    }
}
