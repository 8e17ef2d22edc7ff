#include <transfer/transfer_job.hpp>
#include <utility/enum_string_convert.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <tuple>
#include <utility>

namespace Transfer
{
    UploadPatch JobOutcome::toPatch() const
    {
        return UploadPatch{
            .status = status,
            .error = error,
            .remoteKey = remoteKey,
            .fileId = fileId,
            .encrypted = encrypted,
        };
    }

    TransferJob::TransferJob(
        QueueItem item,
        std::shared_ptr<NegotiationClient> negotiation,
        std::shared_ptr<IObjectStore> objectStore,
        std::optional<EncryptionContext> encryption,
        CancellationSignal cancel,
        Options options,
        ProgressCallback onProgress)
        : item_{std::move(item)}
        , negotiation_{std::move(negotiation)}
        , objectStore_{std::move(objectStore)}
        , encryption_{std::move(encryption)}
        , cancel_{std::move(cancel)}
        , options_{std::move(options)}
        , onProgress_{std::move(onProgress)}
    {
        if (!onProgress_)
            onProgress_ = [](int) {};
    }

    TransferJob::~TransferJob()
    {
        forgetMetadata();
    }

    JobOutcome TransferJob::run()
    {
        using enum TransferStage;

        switch (stage_)
        {
            case (NotStarted):
                [[fallthrough]];
            case (Encrypting):
            {
                if (cancelled())
                    return outcome();
                if (const auto result = prepare(); !result.has_value())
                {
                    Log::error("TransferJob: Failed to prepare '{}': {}", id().value(), result.error().toString());
                    return outcome();
                }
                [[fallthrough]];
            }
            case (Negotiating):
            {
                if (cancelled())
                    return outcome();
                if (!destination_)
                {
                    if (const auto result = negotiate(); !result.has_value())
                    {
                        Log::error(
                            "TransferJob: Failed to negotiate destination for '{}': {}",
                            id().value(),
                            result.error().toString());
                        return outcome();
                    }
                }
                stage_ = Transferring;
                [[fallthrough]];
            }
            case (Transferring):
            {
                if (cancelled())
                    return outcome();
                if (const auto result = transfer(); !result.has_value())
                {
                    if (cancelled())
                        return outcome();
                    Log::error("TransferJob: Failed to transfer '{}': {}", id().value(), result.error().toString());
                    return outcome();
                }
                stage_ = Committing;
                [[fallthrough]];
            }
            case (Committing):
            {
                if (!options_.commitIndividually)
                    return outcome();
                if (cancelled())
                    return outcome();
                if (const auto result = commit(); !result.has_value())
                {
                    Log::error("TransferJob: Failed to commit '{}': {}", id().value(), result.error().toString());
                    return outcome();
                }
                stage_ = Completed;
                forgetMetadata();
                Log::info("TransferJob: '{}' completed.", uploadPayload_->name());
                return outcome();
            }
            case (Completed):
                [[fallthrough]];
            case (Failed):
                [[fallthrough]];
            case (Cancelled):
            {
                Log::warn("TransferJob: '{}' is already settled as {}.", id().value(), Utility::enumToString(stage_));
                return outcome();
            }
        }
        Log::error("TransferJob: Unknown stage: {}", static_cast<int>(stage_));
        std::ignore = enterErrorState(
            {.type = SharedData::TransferErrorType::Implementation, .message = "Unknown transfer stage"});
        return outcome();
    }

    std::expected<SharedData::DestinationRequest, SharedData::TransferError> TransferJob::prepare()
    {
        if (stage_ != TransferStage::NotStarted && stage_ != TransferStage::Encrypting)
        {
            Log::error("TransferJob: Cannot prepare '{}' in stage {}.", id().value(), Utility::enumToString(stage_));
            return std::unexpected(SharedData::TransferError{
                .type = SharedData::TransferErrorType::Implementation,
                .message = "Job was prepared twice",
            });
        }

        auto const* upload = item_.record.upload();
        if (!upload)
        {
            return enterErrorState<SharedData::DestinationRequest>(
                {.type = SharedData::TransferErrorType::Implementation, .message = "Item is not an upload"});
        }
        if (!item_.payload)
        {
            return enterErrorState<SharedData::DestinationRequest>({
                .type = SharedData::TransferErrorType::PayloadUnavailable,
                .message = "The file content is not available anymore",
            });
        }

        stage_ = TransferStage::Encrypting;
        if (encryption_)
        {
            if (const auto result = encrypt(); !result.has_value())
                return std::unexpected(result.error());
        }
        else
        {
            uploadPayload_ = item_.payload;
        }

        request_ = SharedData::DestinationRequest{
            .filename = uploadPayload_->name(),
            .fileType = uploadPayload_->mimeType(),
            .fileSize = uploadPayload_->size(),
            .relativePath = upload->destinationPath,
            .encryption = metadata_,
        };
        stage_ = TransferStage::Negotiating;
        return *request_;
    }

    void TransferJob::adoptDestination(
        std::expected<SharedData::NegotiatedDestination, SharedData::TransferError> destination)
    {
        if (stage_ != TransferStage::Negotiating)
        {
            Log::warn(
                "TransferJob: Ignoring destination for '{}' in stage {}.", id().value(), Utility::enumToString(stage_));
            return;
        }
        if (!destination.has_value())
        {
            Log::error(
                "TransferJob: No destination for '{}': {}", id().value(), destination.error().toString());
            std::ignore = enterErrorState(destination.error());
            return;
        }
        destination_ = std::move(destination).value();
    }

    JobOutcome TransferJob::settleCommit(std::expected<void, SharedData::TransferError> const& commitResult)
    {
        if (!awaitingCommit())
        {
            Log::warn("TransferJob: '{}' does not wait for a commit.", id().value());
            return outcome();
        }
        if (!commitResult.has_value())
        {
            std::ignore = enterErrorState(commitResult.error());
            return outcome();
        }
        stage_ = TransferStage::Completed;
        forgetMetadata();
        return outcome();
    }

    JobOutcome TransferJob::cancel()
    {
        using enum TransferStage;
        if (stage_ != Completed && stage_ != Failed && stage_ != Cancelled)
        {
            stage_ = Cancelled;
            forgetMetadata();
        }
        return outcome();
    }

    std::expected<void, SharedData::TransferError> TransferJob::encrypt()
    {
        auto const& payload = *item_.payload;
        auto plaintext = readPayload(payload);
        if (!plaintext.has_value())
            return enterErrorState(plaintext.error());

        const SharedData::OriginalFileDescriptor original{
            .originalName = payload.name(),
            .originalType = payload.mimeType(),
            .originalSize = payload.size(),
            .originalLastModified = payload.lastModified(),
        };
        auto encrypted = encryption_->pipeline->encrypt(*plaintext, encryption_->secret, original);
        if (!encrypted.has_value())
        {
            return enterErrorState({
                .type = SharedData::TransferErrorType::Encryption,
                .message = encrypted.error().toString(),
            });
        }

        metadata_ = encrypted->metadata;
        encryption_->pipeline->rememberMetadata(payload.name(), *metadata_);
        uploadPayload_ = std::make_shared<MemoryPayload>(
            std::string{encryptedNamePrefix} + payload.name(),
            std::move(encrypted->ciphertext),
            "application/octet-stream",
            payload.lastModified());

        Log::debug(
            "TransferJob: Encrypted '{}' ({} -> {} bytes).", payload.name(), payload.size(), uploadPayload_->size());
        return {};
    }

    std::expected<void, SharedData::TransferError> TransferJob::negotiate()
    {
        auto results = negotiation_->requestDestinations({*request_}, cancel_);
        if (results.size() != 1)
        {
            return enterErrorState({
                .type = SharedData::TransferErrorType::Negotiation,
                .message = fmt::format("Expected one destination, got {}", results.size()),
            });
        }
        if (!results.front().has_value())
            return enterErrorState(results.front().error());
        destination_ = std::move(results.front()).value();
        return {};
    }

    std::expected<void, SharedData::TransferError> TransferJob::transfer()
    {
        const auto timeout = options_.timeouts.timeoutFor(uploadPayload_->size());
        const auto onProgress = [this](std::uint64_t sent, std::uint64_t total) {
            const int percent = total == 0 ? 100 : static_cast<int>(sent * 100 / total);
            if (percent <= lastReportedProgress_)
                return;
            lastReportedProgress_ = percent;
            onProgress_(percent);
        };

        auto result = withRetry(options_.retry, cancel_, fmt::format("Transfer of '{}'", uploadPayload_->name()), [&]() {
            return objectStore_->put(destination_->destination, *uploadPayload_, onProgress, cancel_, timeout);
        });
        if (!result.has_value())
        {
            if (cancel_.isCancelled())
                return std::unexpected(result.error());
            return enterErrorState(result.error());
        }
        return {};
    }

    std::expected<void, SharedData::TransferError> TransferJob::commit()
    {
        if (auto result = negotiation_->commitCompletion({destination_->fileId}, cancel_); !result.has_value())
            return enterErrorState(result.error());
        return {};
    }

    bool TransferJob::cancelled()
    {
        if (!cancel_.isCancelled())
            return stage_ == TransferStage::Cancelled;

        if (stage_ != TransferStage::Cancelled)
        {
            Log::info("TransferJob: '{}' cancelled in stage {}.", id().value(), Utility::enumToString(stage_));
            stage_ = TransferStage::Cancelled;
            forgetMetadata();
        }
        return true;
    }

    void TransferJob::forgetMetadata()
    {
        if (encryption_ && metadata_ && item_.payload)
            encryption_->pipeline->forgetMetadata(item_.payload->name());
    }

    JobOutcome TransferJob::outcome() const
    {
        using enum TransferStage;

        JobOutcome result{
            .id = item_.record.id,
            .error = error_,
            .encrypted = metadata_.has_value(),
        };
        switch (stage_)
        {
            case (Completed):
                result.status = SharedData::UploadStatus::Completed;
                break;
            case (Failed):
                result.status = SharedData::UploadStatus::Failed;
                break;
            case (Cancelled):
                result.status = SharedData::UploadStatus::Cancelled;
                result.error = std::nullopt;
                break;
            default:
                result.status = SharedData::UploadStatus::Uploading;
                break;
        }
        if (destination_)
        {
            result.remoteKey = destination_->remoteKey;
            result.fileId = destination_->fileId;
        }
        return result;
    }
}
