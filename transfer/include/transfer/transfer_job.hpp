#pragma once

#include <transfer/cancellation_signal.hpp>
#include <transfer/negotiation_client.hpp>
#include <transfer/object_store.hpp>
#include <transfer/transfer_policy.hpp>
#include <transfer/transfer_queue.hpp>
#include <crypto/encryption_pipeline.hpp>
#include <shared_data/transfer/transfer_error.hpp>
#include <utility/describe.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Transfer
{
    BOOST_DEFINE_ENUM_CLASS(
        TransferStage,
        NotStarted,
        Encrypting,
        Negotiating,
        Transferring,
        Committing,
        Completed,
        Failed,
        Cancelled)

    /**
     * @brief Secret and pipeline used to encrypt payloads before they leave the machine.
     */
    struct EncryptionContext
    {
        std::shared_ptr<Crypto::EncryptionPipeline> pipeline{};
        std::string secret{};
    };

    struct JobOutcome
    {
        Ids::ItemId id{};
        SharedData::UploadStatus status{SharedData::UploadStatus::Failed};
        std::optional<SharedData::TransferError> error{std::nullopt};
        std::optional<std::string> remoteKey{std::nullopt};
        std::optional<Ids::FileId> fileId{std::nullopt};
        bool encrypted{false};

        UploadPatch toPatch() const;
    };

    /**
     * @brief Moves one upload through encrypt, negotiate, transfer and commit.
     * The cancellation signal is checked before every stage and between transfer chunks.
     */
    class TransferJob
    {
      public:
        constexpr static char const* encryptedNamePrefix = "encrypted_";

        struct Options
        {
            RetryPolicy retry{};
            TimeoutPolicy timeouts{};
            /// When false, run() stops in the Committing stage and the caller commits for many jobs at once.
            bool commitIndividually{true};
        };

        using ProgressCallback = std::function<void(int percent)>;

        TransferJob(
            QueueItem item,
            std::shared_ptr<NegotiationClient> negotiation,
            std::shared_ptr<IObjectStore> objectStore,
            std::optional<EncryptionContext> encryption,
            CancellationSignal cancel,
            Options options,
            ProgressCallback onProgress = {});
        ~TransferJob();
        TransferJob(TransferJob const&) = delete;
        TransferJob& operator=(TransferJob const&) = delete;
        TransferJob(TransferJob&&) = delete;
        TransferJob& operator=(TransferJob&&) = delete;

        /**
         * @brief Runs the encryption stage and builds the negotiation request.
         */
        std::expected<SharedData::DestinationRequest, SharedData::TransferError> prepare();

        /**
         * @brief Takes a destination negotiated by the caller. The job then skips its own negotiation.
         */
        void adoptDestination(std::expected<SharedData::NegotiatedDestination, SharedData::TransferError> destination);

        /**
         * @brief Runs all remaining stages.
         *
         * @return The outcome. While awaitingCommit() is true the outcome is not final.
         */
        JobOutcome run();

        bool awaitingCommit() const
        {
            return stage_ == TransferStage::Committing && !options_.commitIndividually;
        }

        /**
         * @brief Settles a job that waits for an externally performed commit.
         */
        JobOutcome settleCommit(std::expected<void, SharedData::TransferError> const& commitResult);

        /**
         * @brief Settles the job as cancelled if it is not finished yet.
         */
        JobOutcome cancel();

        JobOutcome outcome() const;

        TransferStage stage() const
        {
            return stage_;
        }

        Ids::ItemId const& id() const
        {
            return item_.record.id;
        }

      private:
        std::expected<void, SharedData::TransferError> encrypt();
        std::expected<void, SharedData::TransferError> negotiate();
        std::expected<void, SharedData::TransferError> transfer();
        std::expected<void, SharedData::TransferError> commit();

        bool cancelled();

        template <typename T = void>
        std::expected<T, SharedData::TransferError> enterErrorState(SharedData::TransferError error)
        {
            stage_ = TransferStage::Failed;
            error_ = std::move(error);
            forgetMetadata();
            return std::unexpected(*error_);
        }

        void forgetMetadata();

      private:
        QueueItem item_;
        std::shared_ptr<NegotiationClient> negotiation_;
        std::shared_ptr<IObjectStore> objectStore_;
        std::optional<EncryptionContext> encryption_;
        CancellationSignal cancel_;
        Options options_;
        ProgressCallback onProgress_;
        TransferStage stage_{TransferStage::NotStarted};
        std::shared_ptr<IPayload> uploadPayload_{};
        std::optional<SharedData::DestinationRequest> request_{std::nullopt};
        std::optional<SharedData::EncryptionMetadata> metadata_{std::nullopt};
        std::optional<SharedData::NegotiatedDestination> destination_{std::nullopt};
        std::optional<SharedData::TransferError> error_{std::nullopt};
        int lastReportedProgress_{-1};
    };
}
