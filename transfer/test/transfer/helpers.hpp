#pragma once

#include <transfer/object_store.hpp>
#include <transfer/payload.hpp>
#include <shared_data/transfer/negotiation.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace Transfer::Test
{
    inline std::shared_ptr<IPayload> makePayload(std::string name, std::size_t size = 1024)
    {
        std::vector<std::uint8_t> data(size);
        for (std::size_t i = 0; i != size; ++i)
            data[i] = static_cast<std::uint8_t>(i % 251);
        return std::make_shared<MemoryPayload>(std::move(name), std::move(data), "text/plain", 1'700'000'000'000);
    }

    inline std::vector<std::shared_ptr<IPayload>> makePayloads(std::size_t count, std::size_t size = 128)
    {
        std::vector<std::shared_ptr<IPayload>> payloads{};
        for (std::size_t i = 0; i != count; ++i)
            payloads.push_back(makePayload("file_" + std::to_string(i) + ".bin", size));
        return payloads;
    }

    /**
     * @brief Polls the predicate until it holds or the timeout passed.
     */
    inline bool
    eventually(std::function<bool()> const& predicate, std::chrono::milliseconds timeout = std::chrono::seconds{5})
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        return true;
    }

    /**
     * @brief Answers every request with a destination, file ids count up from the given start.
     */
    inline std::vector<SharedData::NegotiatedDestination>
    destinationsFor(std::vector<SharedData::DestinationRequest> const& requests, std::atomic_int& nextFileId)
    {
        std::vector<SharedData::NegotiatedDestination> destinations{};
        for (auto const& request : requests)
        {
            const auto fileId = nextFileId++;
            destinations.push_back(SharedData::NegotiatedDestination{
                .destination =
                    SharedData::DestinationDescriptor{
                        .url = "https://bucket.example.com/",
                        .fields = {{"key", "uploads/" + request.filename}},
                    },
                .fileId = Ids::makeFileId(std::to_string(fileId)),
                .remoteKey = "uploads/" + request.filename,
            });
        }
        return destinations;
    }

    /**
     * @brief Object store that takes a while per put and records how many puts overlapped.
     */
    class SlowObjectStore : public IObjectStore
    {
      public:
        explicit SlowObjectStore(std::chrono::milliseconds duration, bool honorCancel = true)
            : duration_{duration}
            , honorCancel_{honorCancel}
        {}

        std::expected<void, SharedData::TransferError> put(
            SharedData::DestinationDescriptor const&,
            IPayload const& payload,
            TransferProgressCallback const& onProgress,
            CancellationSignal const& cancel,
            std::chrono::milliseconds) override
        {
            const auto running = ++running_;
            auto peak = peak_.load();
            while (running > peak && !peak_.compare_exchange_weak(peak, running))
            {
            }

            bool cancelled = false;
            if (honorCancel_)
                cancelled = cancel.waitFor(duration_);
            else
                std::this_thread::sleep_for(duration_);

            --running_;
            ++calls_;
            if (cancelled)
                return std::unexpected(
                    SharedData::TransferError{.type = SharedData::TransferErrorType::Transfer, .message = "cancelled"});
            onProgress(payload.size(), payload.size());
            return {};
        }

        int peak() const
        {
            return peak_.load();
        }
        int calls() const
        {
            return calls_.load();
        }

      private:
        std::chrono::milliseconds duration_;
        bool honorCancel_;
        std::atomic_int running_{0};
        std::atomic_int peak_{0};
        std::atomic_int calls_{0};
    };
}
