#pragma once

#include <transfer/object_store.hpp>

#include <string>

namespace Transfer
{
    /**
     * @brief multipart/form-data POST to a presigned destination: every form field, then the file part.
     */
    class PresignedPostStore : public IObjectStore
    {
      public:
        constexpr static std::size_t chunkSize = 256 * 1024;

        std::expected<void, SharedData::TransferError> put(
            SharedData::DestinationDescriptor const& destination,
            IPayload const& payload,
            TransferProgressCallback const& onProgress,
            CancellationSignal const& cancel,
            std::chrono::milliseconds timeout) override;

        struct MultipartFrame
        {
            std::string boundary{};
            std::string head{};
            std::string tail{};
        };
        static MultipartFrame
        makeMultipartFrame(SharedData::DestinationDescriptor const& destination, IPayload const& payload);
    };
}
