#pragma once

#include <transfer/cancellation_signal.hpp>
#include <transfer/payload.hpp>
#include <shared_data/transfer/negotiation.hpp>
#include <shared_data/transfer/transfer_error.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>

namespace Transfer
{
    using TransferProgressCallback = std::function<void(std::uint64_t sent, std::uint64_t total)>;

    /**
     * @brief Puts bytes to a negotiated destination.
     */
    class IObjectStore
    {
      public:
        virtual ~IObjectStore() = default;

        /**
         * @brief Transfers the payload. Fails with a Transfer error if cancelled in between chunks.
         *
         * @param destination Where to put the bytes.
         * @param payload What to put.
         * @param onProgress Called after every chunk.
         * @param cancel Checked between chunks.
         * @param timeout Upper bound for every network operation.
         */
        virtual std::expected<void, SharedData::TransferError> put(
            SharedData::DestinationDescriptor const& destination,
            IPayload const& payload,
            TransferProgressCallback const& onProgress,
            CancellationSignal const& cancel,
            std::chrono::milliseconds timeout) = 0;
    };
}
