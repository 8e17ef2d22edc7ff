#pragma once

#include <transfer/cancellation_signal.hpp>
#include <transfer/negotiation_client.hpp>
#include <transfer/transfer_queue.hpp>

#include <memory>

namespace Transfer
{
    /**
     * @brief Executes one claimed delete operation and reports its progress to the queue.
     */
    class DeleteRunner
    {
      public:
        DeleteRunner(
            std::shared_ptr<TransferQueue> queue,
            std::shared_ptr<NegotiationClient> negotiation,
            CancellationSignal cancel);

        /**
         * @brief Deletes all targets of the operation. completedFiles counts processed ids, failed ones included.
         */
        void run(QueueItem const& item);

      private:
        std::shared_ptr<TransferQueue> queue_;
        std::shared_ptr<NegotiationClient> negotiation_;
        CancellationSignal cancel_;
    };
}
