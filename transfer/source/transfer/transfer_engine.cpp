#include <transfer/transfer_engine.hpp>
#include <crypto/encryption_pipeline.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <condition_variable>
#include <mutex>

namespace Transfer
{
    std::string EngineError::toString() const
    {
        return fmt::format("{}: {}", boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE"), message);
    }

    TransferEngine::Options TransferEngine::Options::fromState(Persistence::State const& state)
    {
        Options options{};
        auto const& transfer = state.transfer;
        auto const& queue = state.queue;
        auto const& limits = state.limits;

        if (transfer.concurrency && *transfer.concurrency > 0)
            options.scheduler.concurrency = static_cast<std::size_t>(*transfer.concurrency);
        if (transfer.shardSize)
            options.scheduler.shardSize = *transfer.shardSize;
        if (transfer.workerCount && *transfer.workerCount >= 0)
            options.scheduler.workers.workerCount = static_cast<std::size_t>(*transfer.workerCount);
        if (transfer.cancelGracePeriodMilliseconds)
            options.scheduler.workers.cancelGracePeriod =
                std::chrono::milliseconds{*transfer.cancelGracePeriodMilliseconds};
        if (transfer.throttleWindowMilliseconds)
            options.throttleWindow = std::chrono::milliseconds{*transfer.throttleWindowMilliseconds};
        if (transfer.negotiationChunkSize)
            options.negotiation.negotiationChunkSize = *transfer.negotiationChunkSize;
        if (transfer.deleteChunkSize)
            options.negotiation.deleteChunkSize = *transfer.deleteChunkSize;

        RetryPolicy retry{};
        if (transfer.retry)
        {
            retry.maxAttempts = transfer.retry->maxAttempts.value_or(retry.maxAttempts);
            if (transfer.retry->backoffMilliseconds)
                retry.backoff = std::chrono::milliseconds{*transfer.retry->backoffMilliseconds};
        }
        TimeoutPolicy timeouts{};
        if (transfer.timeouts)
        {
            if (transfer.timeouts->baseSeconds)
                timeouts.base = std::chrono::seconds{*transfer.timeouts->baseSeconds};
            if (transfer.timeouts->perMegabyteMilliseconds)
                timeouts.perMegabyte = std::chrono::milliseconds{*transfer.timeouts->perMegabyteMilliseconds};
        }
        options.negotiation.retry = retry;
        options.scheduler.job = TransferJob::Options{.retry = retry, .timeouts = timeouts};
        options.scheduler.workers.job = options.scheduler.job;

        if (transfer.shardThreshold)
            options.queue.shardThreshold = *transfer.shardThreshold;
        options.queue.autoRemoveCompleted = queue.autoRemoveCompleted.value_or(options.queue.autoRemoveCompleted);
        options.queue.maxRetainedItems = queue.maxRetainedItems.value_or(options.queue.maxRetainedItems);
        options.queue.limits = Limits{
            .maxFileSize = limits.maxFileSize.value_or(options.queue.limits.maxFileSize),
            .maxFiles = limits.maxFiles.value_or(options.queue.limits.maxFiles),
            .maxTotalSize = limits.maxTotalSize.value_or(options.queue.limits.maxTotalSize),
            .maxNameLength = limits.maxNameLength.value_or(options.queue.limits.maxNameLength),
        };
        return options;
    }

    struct TransferEngine::Implementation
    {
        Options options;
        std::shared_ptr<Persistence::IQueueStore> store;
        std::shared_ptr<Crypto::EncryptionPipeline> pipeline;
        std::shared_ptr<NegotiationClient> negotiation;
        std::shared_ptr<TransferQueue> queue;
        std::shared_ptr<Scheduler> scheduler;
        std::unique_ptr<StateAggregator> aggregator;

        mutable std::mutex stateMutex;
        std::condition_variable idleCondition;
        std::optional<std::string> secret;
        bool initialized;

        Implementation(
            Options options,
            std::shared_ptr<Persistence::IQueueStore> store,
            std::shared_ptr<IBackendApi> backend,
            std::shared_ptr<IObjectStore> objectStore)
            : options{std::move(options)}
            , store{std::move(store)}
            , pipeline{std::make_shared<Crypto::EncryptionPipeline>()}
            , negotiation{std::make_shared<NegotiationClient>(std::move(backend), this->options.negotiation)}
            , queue{std::make_shared<TransferQueue>(this->store, this->options.queue)}
            , scheduler{std::make_shared<Scheduler>(
                  queue,
                  negotiation,
                  std::move(objectStore),
                  this->options.scheduler)}
            , aggregator{std::make_unique<StateAggregator>(
                  [queue = queue]() {
                      return queue->snapshot();
                  },
                  this->options.throttleWindow)}
            , stateMutex{}
            , idleCondition{}
            , secret{std::nullopt}
            , initialized{false}
        {}

        std::expected<void, SharedData::TransferError> requireInitialized() const
        {
            std::scoped_lock lock{stateMutex};
            if (!initialized)
            {
                Log::warn("TransferEngine: Engine is not initialized.");
                return std::unexpected(SharedData::TransferError{
                    .type = SharedData::TransferErrorType::Implementation,
                    .message = "Engine is not initialized",
                });
            }
            return {};
        }
    };

    TransferEngine::TransferEngine(
        Options options,
        std::shared_ptr<Persistence::IQueueStore> store,
        std::shared_ptr<IBackendApi> backend,
        std::shared_ptr<IObjectStore> objectStore)
        : impl_{std::make_unique<Implementation>(
              std::move(options),
              std::move(store),
              std::move(backend),
              std::move(objectStore))}
    {
        impl_->queue->setChangeListener([impl = impl_.get()](bool edge) {
            if (edge)
                impl->aggregator->publishNow();
            else
                impl->aggregator->schedulePublish();
            {
                std::scoped_lock lock{impl->stateMutex};
            }
            impl->idleCondition.notify_all();
        });
    }

    TransferEngine::~TransferEngine()
    {
        if (impl_)
            shutdown();
    }

    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL_NO_DTOR(TransferEngine);

    std::expected<void, EngineError> TransferEngine::init(PayloadResolver const& resolver, bool startPaused)
    {
        {
            std::scoped_lock lock{impl_->stateMutex};
            if (impl_->initialized)
                return std::unexpected(EngineError{.type = EngineErrorType::AlreadyInitialized});
        }

        auto records = impl_->store->getAll();
        if (!records.has_value())
        {
            Log::error("TransferEngine: Could not read the persisted queue: {}", records.error().toString());
            return std::unexpected(EngineError{
                .type = EngineErrorType::StoreFailure,
                .message = records.error().toString(),
            });
        }

        impl_->aggregator->start();
        impl_->queue->restore(*records);
        if (resolver)
        {
            std::size_t reattached = 0;
            for (auto const& record : *records)
            {
                if (!record.upload() || !record.isQueued())
                    continue;
                if (auto payload = resolver(record); payload && impl_->queue->reattachPayload(record.id, payload))
                    ++reattached;
            }
            Log::info("TransferEngine: Reattached {} payloads.", reattached);
            impl_->queue->failDetached();
        }
        if (startPaused)
            impl_->scheduler->pause();
        impl_->scheduler->start();
        {
            std::scoped_lock lock{impl_->stateMutex};
            impl_->initialized = true;
        }
        Log::info("TransferEngine: Initialized with {} items.", impl_->queue->size());
        return {};
    }

    void TransferEngine::shutdown()
    {
        {
            std::scoped_lock lock{impl_->stateMutex};
            if (!impl_->initialized)
                return;
            impl_->initialized = false;
        }
        Log::info("TransferEngine: Shutting down.");
        impl_->scheduler->stop();
        impl_->aggregator->stop();
        impl_->pipeline->clearMetadataCache();
        impl_->idleCondition.notify_all();
        Log::info("TransferEngine: Shut down.");
    }

    bool TransferEngine::isInitialized() const
    {
        std::scoped_lock lock{impl_->stateMutex};
        return impl_->initialized;
    }

    std::expected<Ids::ItemId, SharedData::TransferError>
    TransferEngine::enqueue(std::shared_ptr<IPayload> payload, std::string const& destinationPath)
    {
        if (auto ready = impl_->requireInitialized(); !ready)
            return std::unexpected(ready.error());
        auto id = impl_->queue->enqueue(std::move(payload), destinationPath);
        if (id)
            impl_->scheduler->wake();
        return id;
    }

    std::expected<std::vector<Ids::ItemId>, SharedData::TransferError> TransferEngine::enqueueBatch(
        std::vector<std::shared_ptr<IPayload>> const& payloads,
        std::string const& destinationPath)
    {
        if (auto ready = impl_->requireInitialized(); !ready)
            return std::unexpected(ready.error());
        auto ids = impl_->queue->enqueueBatch(payloads, destinationPath);
        if (ids)
            impl_->scheduler->wake();
        return ids;
    }

    Ids::SessionId TransferEngine::startSession(std::size_t total)
    {
        return impl_->queue->startSession(total);
    }

    std::optional<UploadSession> TransferEngine::endSession()
    {
        return impl_->queue->endSession();
    }

    std::size_t TransferEngine::cancelAll()
    {
        std::size_t cancelled = 0;
        impl_->scheduler->cancelAll([this, &cancelled]() {
            cancelled = impl_->queue->cancelAll();
        });
        return cancelled;
    }

    bool TransferEngine::cancel(Ids::ItemId const& id)
    {
        bool cancelled = false;
        impl_->scheduler->cancel(id, [this, &id, &cancelled]() {
            cancelled = impl_->queue->cancel(id);
        });
        return cancelled;
    }

    void TransferEngine::clearAll()
    {
        impl_->scheduler->cancelAll([this]() {
            impl_->queue->clearAll();
        });
    }

    void TransferEngine::pause()
    {
        impl_->scheduler->pause();
    }

    void TransferEngine::resume()
    {
        impl_->scheduler->resume();
    }

    bool TransferEngine::isPaused() const
    {
        return impl_->scheduler->isPaused();
    }

    Ids::ItemId TransferEngine::addDeleteOperation(std::vector<Ids::FileId> targets)
    {
        auto id = impl_->queue->addDeleteOperation(std::move(targets));
        impl_->scheduler->wake();
        return id;
    }

    bool TransferEngine::updateDeleteOperation(Ids::ItemId const& id, DeletePatch const& patch)
    {
        return impl_->queue->updateDeleteOperation(id, patch);
    }

    std::expected<void, Crypto::CryptoError> TransferEngine::setEncryptionSecret(std::string const& secret)
    {
        if (auto result = impl_->pipeline->selfTest(secret); !result.has_value())
        {
            Log::error("TransferEngine: Rejected encryption secret: {}", result.error().toString());
            return std::unexpected(result.error());
        }
        {
            std::scoped_lock lock{impl_->stateMutex};
            impl_->secret = secret;
        }
        impl_->scheduler->setEncryption(EncryptionContext{.pipeline = impl_->pipeline, .secret = secret});
        Log::info("TransferEngine: Encryption enabled.");
        return {};
    }

    void TransferEngine::disableEncryption()
    {
        {
            std::scoped_lock lock{impl_->stateMutex};
            impl_->secret.reset();
        }
        impl_->scheduler->setEncryption(std::nullopt);
        impl_->pipeline->clearMetadataCache();
        Log::info("TransferEngine: Encryption disabled.");
    }

    bool TransferEngine::isEncryptionEnabled() const
    {
        std::scoped_lock lock{impl_->stateMutex};
        return impl_->secret.has_value();
    }

    std::size_t TransferEngine::acknowledge(std::vector<Ids::ItemId> const& ids)
    {
        return impl_->queue->acknowledge(ids);
    }

    bool TransferEngine::reattachPayload(Ids::ItemId const& id, std::shared_ptr<IPayload> payload)
    {
        if (!impl_->queue->reattachPayload(id, std::move(payload)))
            return false;
        impl_->scheduler->wake();
        return true;
    }

    SharedData::QueueSnapshot TransferEngine::snapshot() const
    {
        return impl_->queue->snapshot();
    }

    StateAggregator::Unsubscribe TransferEngine::subscribe(StateAggregator::Subscriber subscriber)
    {
        return impl_->aggregator->subscribe(std::move(subscriber));
    }

    bool TransferEngine::waitUntilIdle(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock{impl_->stateMutex};
        return impl_->idleCondition.wait_for(lock, timeout, [this]() {
            return !impl_->initialized ||
                (impl_->queue->queuedCount() == 0 && impl_->queue->activeCount() == 0);
        });
    }

    std::size_t TransferEngine::peakActiveCount() const
    {
        return impl_->scheduler->peakActiveCount();
    }
}
