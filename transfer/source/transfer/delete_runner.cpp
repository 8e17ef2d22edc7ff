#include <transfer/delete_runner.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

namespace Transfer
{
    DeleteRunner::DeleteRunner(
        std::shared_ptr<TransferQueue> queue,
        std::shared_ptr<NegotiationClient> negotiation,
        CancellationSignal cancel)
        : queue_{std::move(queue)}
        , negotiation_{std::move(negotiation)}
        , cancel_{std::move(cancel)}
    {}

    void DeleteRunner::run(QueueItem const& item)
    {
        auto const* deletion = item.record.deletion();
        if (!deletion)
        {
            Log::error("DeleteRunner: Item {} is not a delete operation.", item.record.id.value());
            return;
        }

        auto const& id = item.record.id;
        Log::info("DeleteRunner: Deleting {} files for {}.", deletion->targets.size(), id.value());

        const auto result = negotiation_->bulkDelete(
            deletion->targets,
            [this, &id](std::uint64_t processed, std::uint64_t) {
                queue_->updateDeleteOperation(id, DeletePatch{.completedFiles = processed});
            },
            cancel_);

        const auto processed = result.successCount + static_cast<std::uint64_t>(result.failedItems.size());
        if (processed < deletion->targets.size())
        {
            Log::warn(
                "DeleteRunner: Deletion {} interrupted after {} of {} files.",
                id.value(),
                processed,
                deletion->targets.size());
            queue_->updateDeleteOperation(
                id,
                DeletePatch{
                    .status = SharedData::DeleteStatus::Failed,
                    .completedFiles = processed,
                    .failedFiles = result.failedItems.size(),
                    .error =
                        SharedData::TransferError{
                            .type = SharedData::TransferErrorType::Interrupted,
                            .message = fmt::format("Stopped after {} of {} files", processed, deletion->targets.size()),
                        },
                });
            return;
        }

        for (auto const& failed : result.failedItems)
            Log::warn("DeleteRunner: Could not delete {}: {}", failed.fileId.value(), failed.error);

        Log::info(
            "DeleteRunner: Deletion {} finished, {} deleted, {} failed.",
            id.value(),
            result.successCount,
            result.failedItems.size());
        queue_->updateDeleteOperation(
            id,
            DeletePatch{
                .status = SharedData::DeleteStatus::Completed,
                .completedFiles = processed,
                .failedFiles = result.failedItems.size(),
            });
    }
}
