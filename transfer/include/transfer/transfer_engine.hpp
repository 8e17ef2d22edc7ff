#pragma once

#include <transfer/backend_api.hpp>
#include <transfer/negotiation_client.hpp>
#include <transfer/object_store.hpp>
#include <transfer/payload.hpp>
#include <transfer/scheduler.hpp>
#include <transfer/state_aggregator.hpp>
#include <transfer/transfer_queue.hpp>
#include <crypto/crypto_error.hpp>
#include <persistence/queue_store.hpp>
#include <persistence/state/state.hpp>
#include <utility/describe.hpp>

#include <roar/detail/pimpl_special_functions.hpp>

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Transfer
{
    BOOST_DEFINE_ENUM_CLASS(EngineErrorType, AlreadyInitialized, StoreFailure)

    struct EngineError
    {
        EngineErrorType type{EngineErrorType::StoreFailure};
        std::string message{};

        std::string toString() const;
    };

    /**
     * @brief Owns queue, scheduler and aggregator. Nothing runs before init() and nothing after shutdown().
     */
    class TransferEngine
    {
      public:
        struct Options
        {
            TransferQueue::Options queue{};
            Scheduler::Options scheduler{};
            NegotiationClient::Options negotiation{};
            std::chrono::milliseconds throttleWindow{StateAggregator::defaultWindow};

            /**
             * @brief Builds the options from a configuration, unset values keep their defaults.
             */
            static Options fromState(Persistence::State const& state);
        };

        TransferEngine(
            Options options,
            std::shared_ptr<Persistence::IQueueStore> store,
            std::shared_ptr<IBackendApi> backend,
            std::shared_ptr<IObjectStore> objectStore);
        ROAR_PIMPL_SPECIAL_FUNCTIONS(TransferEngine);

        /// Supplies the content of a restored upload, or nullptr if it is gone.
        using PayloadResolver = std::function<std::shared_ptr<IPayload>(SharedData::QueueRecord const&)>;

        /**
         * @brief Restores the persisted queue and starts processing. Queued uploads the resolver cannot supply
         * fail as unavailable before anything is scheduled.
         *
         * @param startPaused Nothing is claimed until resume() is called.
         */
        std::expected<void, EngineError> init(PayloadResolver const& resolver = {}, bool startPaused = false);

        /**
         * @brief Cancels running work and stops all threads. Called by the destructor.
         */
        void shutdown();

        bool isInitialized() const;

        std::expected<Ids::ItemId, SharedData::TransferError>
        enqueue(std::shared_ptr<IPayload> payload, std::string const& destinationPath);
        std::expected<std::vector<Ids::ItemId>, SharedData::TransferError>
        enqueueBatch(std::vector<std::shared_ptr<IPayload>> const& payloads, std::string const& destinationPath);

        Ids::SessionId startSession(std::size_t total);
        std::optional<UploadSession> endSession();

        std::size_t cancelAll();

        /**
         * @brief Cancels one queued or running upload.
         *
         * @return false if the upload is unknown or already finished.
         */
        bool cancel(Ids::ItemId const& id);
        void clearAll();

        /**
         * @brief Stops starting new work. Running transfers and delete operations are not interrupted.
         */
        void pause();
        void resume();
        bool isPaused() const;

        Ids::ItemId addDeleteOperation(std::vector<Ids::FileId> targets);
        bool updateDeleteOperation(Ids::ItemId const& id, DeletePatch const& patch);

        /**
         * @brief Verifies the secret with a self test and encrypts all uploads started afterwards.
         */
        std::expected<void, Crypto::CryptoError> setEncryptionSecret(std::string const& secret);
        void disableEncryption();
        bool isEncryptionEnabled() const;

        std::size_t acknowledge(std::vector<Ids::ItemId> const& ids);
        bool reattachPayload(Ids::ItemId const& id, std::shared_ptr<IPayload> payload);

        SharedData::QueueSnapshot snapshot() const;
        StateAggregator::Unsubscribe subscribe(StateAggregator::Subscriber subscriber);

        /**
         * @brief Blocks until no upload or delete operation is queued or active, or the timeout passed.
         *
         * @return true if the queue drained.
         */
        bool waitUntilIdle(std::chrono::milliseconds timeout);

        std::size_t peakActiveCount() const;

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
