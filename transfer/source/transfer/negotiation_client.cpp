#include <transfer/negotiation_client.hpp>
#include <utility/chunked.hpp>
#include <log/log.hpp>

namespace Transfer
{
    NegotiationClient::NegotiationClient(std::shared_ptr<IBackendApi> backend, Options options)
        : backend_{std::move(backend)}
        , options_{std::move(options)}
    {}

    std::vector<std::expected<SharedData::NegotiatedDestination, SharedData::TransferError>>
    NegotiationClient::requestDestinations(
        std::vector<SharedData::DestinationRequest> const& requests,
        CancellationSignal const& cancel) const
    {
        std::vector<std::expected<SharedData::NegotiatedDestination, SharedData::TransferError>> results{};
        results.reserve(requests.size());

        const auto chunks =
            Utility::chunked(std::span<SharedData::DestinationRequest const>{requests}, options_.negotiationChunkSize);
        for (auto const& chunk : chunks)
        {
            const auto failChunk = [&results, &chunk](SharedData::TransferError const& error) {
                for (std::size_t i = 0; i != chunk.size(); ++i)
                    results.push_back(std::unexpected(error));
            };

            if (cancel.isCancelled())
            {
                failChunk(SharedData::TransferError{
                    .type = SharedData::TransferErrorType::Negotiation,
                    .message = "Negotiation was cancelled",
                });
                continue;
            }

            const std::vector<SharedData::DestinationRequest> chunkRequests{chunk.begin(), chunk.end()};
            auto response = withRetry(options_.retry, cancel, "Negotiating destinations", [this, &chunkRequests]() {
                return backend_->negotiateDestinations(chunkRequests);
            });

            if (!response)
            {
                Log::error(
                    "NegotiationClient: Negotiation of {} files failed: {}", chunk.size(), response.error().toString());
                failChunk(toTransferError(response.error(), SharedData::TransferErrorType::Negotiation));
                continue;
            }

            if (response->size() != chunk.size())
            {
                Log::error(
                    "NegotiationClient: Backend returned {} destinations for {} files.", response->size(), chunk.size());
                failChunk(SharedData::TransferError{
                    .type = SharedData::TransferErrorType::Negotiation,
                    .message = fmt::format(
                        "Backend returned {} destinations for {} files", response->size(), chunk.size()),
                });
                continue;
            }

            for (auto& destination : *response)
                results.push_back(std::move(destination));
        }
        return results;
    }

    std::expected<void, SharedData::TransferError>
    NegotiationClient::commitCompletion(std::vector<Ids::FileId> const& fileIds, CancellationSignal const& cancel) const
    {
        const auto chunks = Utility::chunked(std::span<Ids::FileId const>{fileIds}, options_.negotiationChunkSize);
        for (auto const& chunk : chunks)
        {
            const std::vector<Ids::FileId> chunkIds{chunk.begin(), chunk.end()};
            auto result = withRetry(options_.retry, cancel, "Committing completion", [this, &chunkIds]() {
                return backend_->commitCompletion(chunkIds);
            });
            if (!result)
            {
                Log::error(
                    "NegotiationClient: Commit of {} files failed: {}", chunkIds.size(), result.error().toString());
                return std::unexpected(toTransferError(result.error(), SharedData::TransferErrorType::Commit));
            }
        }
        return {};
    }

    SharedData::BulkDeleteResult NegotiationClient::bulkDelete(
        std::vector<Ids::FileId> const& fileIds,
        DeleteProgressCallback const& onProgress,
        CancellationSignal const& cancel) const
    {
        SharedData::BulkDeleteResult total{};
        std::uint64_t processed = 0;

        const auto chunks = Utility::chunked(std::span<Ids::FileId const>{fileIds}, options_.deleteChunkSize);
        for (auto const& chunk : chunks)
        {
            if (cancel.isCancelled())
            {
                Log::info("NegotiationClient: Deletion cancelled after {} of {} files.", processed, fileIds.size());
                break;
            }

            const std::vector<Ids::FileId> chunkIds{chunk.begin(), chunk.end()};
            auto result = withRetry(options_.retry, cancel, "Deleting files", [this, &chunkIds]() {
                return backend_->bulkDelete(chunkIds);
            });

            if (result)
            {
                total.successCount += result->successCount;
                for (auto& failed : result->failedItems)
                    total.failedItems.push_back(std::move(failed));
            }
            else
            {
                Log::error("NegotiationClient: Deleting {} files failed: {}", chunkIds.size(), result.error().toString());
                for (auto const& id : chunkIds)
                {
                    total.failedItems.push_back(SharedData::FailedDeletion{
                        .fileId = id,
                        .error = result.error().toString(),
                    });
                }
            }

            processed += chunkIds.size();
            if (onProgress)
                onProgress(processed, fileIds.size());
        }
        return total;
    }
}
