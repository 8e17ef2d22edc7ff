#pragma once

#include <transfer/backend_api.hpp>
#include <transfer/cancellation_signal.hpp>
#include <transfer/transfer_policy.hpp>

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace Transfer
{
    using DeleteProgressCallback = std::function<void(std::uint64_t completed, std::uint64_t total)>;

    /**
     * @brief Splits backend calls into chunks the backend accepts and retries transient failures.
     */
    class NegotiationClient
    {
      public:
        struct Options
        {
            std::size_t negotiationChunkSize{1000};
            std::size_t deleteChunkSize{1000};
            RetryPolicy retry{};
        };

        NegotiationClient(std::shared_ptr<IBackendApi> backend, Options options);

        /**
         * @brief Result i belongs to request i. A failed chunk fails all of its items with the same error,
         * other chunks are not affected.
         */
        std::vector<std::expected<SharedData::NegotiatedDestination, SharedData::TransferError>> requestDestinations(
            std::vector<SharedData::DestinationRequest> const& requests,
            CancellationSignal const& cancel = {}) const;

        std::expected<void, SharedData::TransferError>
        commitCompletion(std::vector<Ids::FileId> const& fileIds, CancellationSignal const& cancel = {}) const;

        /**
         * @brief Deletes chunk by chunk. onProgress receives the cumulative number of processed ids after every chunk.
         * Ids of a chunk that failed entirely are reported as failed items. Chunks not started before the signal
         * fired are neither.
         */
        SharedData::BulkDeleteResult bulkDelete(
            std::vector<Ids::FileId> const& fileIds,
            DeleteProgressCallback const& onProgress = {},
            CancellationSignal const& cancel = {}) const;

        Options const& options() const
        {
            return options_;
        }

      private:
        std::shared_ptr<IBackendApi> backend_;
        Options options_;
    };
}
