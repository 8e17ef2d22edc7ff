#pragma once

#include <shared_data/transfer/negotiation.hpp>
#include <shared_data/transfer/transfer_error.hpp>
#include <ids/ids.hpp>

#include <expected>
#include <string>
#include <vector>

namespace Transfer
{
    struct BackendError
    {
        /// 0 if no response was received.
        int httpStatus{0};
        std::string message{};
        bool timedOut{false};

        /**
         * @brief Network errors, timeouts, 5xx, 408 and 429 may succeed on another attempt. Other 4xx never do.
         */
        bool isTransient() const
        {
            return httpStatus == 0 || httpStatus >= 500 || httpStatus == 408 || httpStatus == 429;
        }

        std::string toString() const;
    };

    /**
     * @brief Maps a backend failure onto the item error taxonomy.
     *
     * @param error The failure.
     * @param permanentType Type used for a permanent failure that is not an authentication problem.
     */
    SharedData::TransferError toTransferError(BackendError const& error, SharedData::TransferErrorType permanentType);

    /**
     * @brief The backend contract. Every call is idempotent per item.
     */
    class IBackendApi
    {
      public:
        virtual ~IBackendApi() = default;

        /**
         * @brief Mints one destination per request. On success the result is positional to the requests.
         */
        virtual std::expected<std::vector<SharedData::NegotiatedDestination>, BackendError>
        negotiateDestinations(std::vector<SharedData::DestinationRequest> const& requests) = 0;

        virtual std::expected<void, BackendError> commitCompletion(std::vector<Ids::FileId> const& fileIds) = 0;

        virtual std::expected<SharedData::BulkDeleteResult, BackendError>
        bulkDelete(std::vector<Ids::FileId> const& fileIds) = 0;
    };
}
