#include <transfer/scheduler.hpp>
#include <utility/overloaded.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>

#include <algorithm>

namespace Transfer
{
    Scheduler::Scheduler(
        std::shared_ptr<TransferQueue> queue,
        std::shared_ptr<NegotiationClient> negotiation,
        std::shared_ptr<IObjectStore> objectStore,
        Options options)
        : queue_{std::move(queue)}
        , negotiation_{std::move(negotiation)}
        , objectStore_{std::move(objectStore)}
        , options_{std::move(options)}
    {
        options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
        options_.shardSize = std::max<std::size_t>(options_.shardSize, 1);
    }

    Scheduler::~Scheduler()
    {
        stop();
    }

    template <typename FunctionT>
    void Scheduler::runOnOrchestrator(FunctionT&& func)
    {
        if (!orchestrator_.isRunning() || orchestrator_.withinProcessingThread())
        {
            func();
            return;
        }
        try
        {
            orchestrator_.pushPromiseTask(std::forward<FunctionT>(func)).get();
        }
        catch (std::exception const& exc)
        {
            Log::error("Scheduler: Orchestrator task failed: {}", exc.what());
        }
    }

    void Scheduler::start()
    {
        if (running_.exchange(true))
            return;

        orchestrator_.start(std::chrono::milliseconds{100});
        pool_ = std::make_unique<boost::asio::thread_pool>(options_.concurrency);
        runOnOrchestrator([this]() {
            stopping_ = false;
            workers_ = std::make_unique<WorkerPool>(
                orchestrator_, negotiation_, objectStore_, options_.workers, [this](WorkerMessage const& message) {
                    onWorkerMessage(message);
                });
        });
        Log::info(
            "Scheduler: Started with {} slots, shards of {} items on {} workers.",
            options_.concurrency,
            options_.shardSize,
            options_.workers.workerCount);
        wake();
    }

    void Scheduler::stop()
    {
        if (!running_.exchange(false))
            return;

        Log::info("Scheduler: Stopping.");
        runOnOrchestrator([this]() {
            stopping_ = true;
            cancel_.cancel();
            shutdown_.cancel();
            if (workers_)
                workers_->shutdown();
        });
        pool_->join();
        orchestrator_.stop();
        workers_.reset();
        pool_.reset();
        Log::info("Scheduler: Stopped.");
    }

    void Scheduler::wake()
    {
        orchestrator_.pushTask([weak = weak_from_this()]() {
            if (auto self = weak.lock(); self)
                self->tick();
        });
    }

    void Scheduler::cancelAll(std::function<void()> const& settleQueue)
    {
        if (!running_)
        {
            if (settleQueue)
                settleQueue();
            return;
        }

        runOnOrchestrator([this, &settleQueue]() {
            if (settleQueue)
                settleQueue();
            cancel_.cancel();
            cancel_ = CancellationSignal{};
            ++generation_;
            shardItems_.clear();
            jobSignals_.clear();
            active_ = runningDeletes_;
            activeMirror_ = active_;
            if (workers_)
                workers_->cancelAll();
            Log::info("Scheduler: Cancelled all transfers, generation {}.", generation_);
        });
        wake();
    }

    bool Scheduler::cancel(Ids::ItemId const& id, std::function<void()> const& settleQueue)
    {
        if (!running_)
        {
            if (settleQueue)
                settleQueue();
            return false;
        }

        bool found = false;
        runOnOrchestrator([this, &id, &settleQueue, &found]() {
            if (settleQueue)
                settleQueue();
            if (auto iter = jobSignals_.find(id); iter != jobSignals_.end())
            {
                iter->second.cancel();
                found = true;
            }
            else if (shardItems_.contains(id) && workers_)
                found = workers_->cancelItem(id);
        });
        if (found)
            Log::info("Scheduler: Cancelled transfer of {}.", id.value());
        return found;
    }

    void Scheduler::pause()
    {
        runOnOrchestrator([this]() {
            paused_ = true;
            pausedMirror_ = true;
        });
        Log::info("Scheduler: Paused.");
    }

    void Scheduler::resume()
    {
        runOnOrchestrator([this]() {
            paused_ = false;
            pausedMirror_ = false;
        });
        Log::info("Scheduler: Resumed.");
        if (running_)
            wake();
    }

    void Scheduler::setEncryption(std::optional<EncryptionContext> encryption)
    {
        runOnOrchestrator([this, encryption = std::move(encryption)]() mutable {
            encryption_ = std::move(encryption);
        });
    }

    void Scheduler::occupy(std::size_t slots)
    {
        active_ += slots;
        activeMirror_ = active_;
        if (active_ > peakActive_)
            peakActive_ = active_;
    }

    void Scheduler::release(std::size_t slots)
    {
        active_ -= std::min(slots, active_);
        activeMirror_ = active_;
    }

    void Scheduler::tick()
    {
        if (stopping_ || paused_)
            return;

        while (active_ < options_.concurrency)
        {
            const auto freeSlots = options_.concurrency - active_;
            auto claim = queue_->claimNext(std::min(options_.shardSize, freeSlots));
            if (!claim)
                break;
            launch(std::move(*claim));
        }
    }

    void Scheduler::launch(Claim claim)
    {
        if (claim.items.empty())
            return;

        if (claim.items.front().record.deletion())
        {
            launchDelete(std::move(claim.items.front()));
            return;
        }

        if (claim.batchId && workers_ && workers_->idleWorkerCount() > 0)
        {
            const auto count = claim.items.size();
            for (auto const& item : claim.items)
                shardItems_.insert(item.record.id);
            occupy(count);
            Log::debug("Scheduler: Dispatching {} items of batch {} to a worker.", count, claim.batchId->value());
            if (workers_->dispatch(RunShard{.items = claim.items, .encryption = encryption_}))
                return;

            for (auto const& item : claim.items)
                shardItems_.erase(item.record.id);
            release(count);
        }

        for (auto& item : claim.items)
            launchJob(std::move(item));
    }

    void Scheduler::launchJob(QueueItem item)
    {
        occupy(1);
        const auto id = item.record.id;
        auto signal = cancel_.child();
        jobSignals_.insert_or_assign(id, signal);
        auto job = std::make_shared<TransferJob>(
            std::move(item),
            negotiation_,
            objectStore_,
            encryption_,
            std::move(signal),
            options_.job,
            [queue = queue_, id](int percent) {
                queue->updateItem(id, UploadPatch{.progress = percent});
            });

        boost::asio::post(*pool_, [weak = weak_from_this(), job = std::move(job), generation = generation_]() {
            auto outcome = job->run();
            if (auto self = weak.lock(); self)
            {
                const bool pushed =
                    self->orchestrator_.pushTask([weak, outcome = std::move(outcome), generation]() {
                        if (auto self = weak.lock(); self)
                            self->onJobFinished(generation, outcome);
                    });
                if (!pushed)
                    Log::warn("Scheduler: Outcome of {} arrived after shutdown.", job->id().value());
            }
        });
    }

    void Scheduler::launchDelete(QueueItem item)
    {
        occupy(1);
        ++runningDeletes_;
        boost::asio::post(
            *pool_,
            [weak = weak_from_this(),
             runner = DeleteRunner{queue_, negotiation_, shutdown_},
             item = std::move(item)]() mutable {
                runner.run(item);
                if (auto self = weak.lock(); self)
                {
                    self->orchestrator_.pushTask([weak]() {
                        if (auto self = weak.lock(); self)
                            self->onDeleteFinished();
                    });
                }
            });
    }

    void Scheduler::onJobFinished(std::uint64_t generation, JobOutcome const& outcome)
    {
        queue_->updateItem(outcome.id, outcome.toPatch());
        if (generation == generation_)
        {
            jobSignals_.erase(outcome.id);
            release(1);
        }
        tick();
    }

    void Scheduler::onDeleteFinished()
    {
        if (runningDeletes_ > 0)
            --runningDeletes_;
        release(1);
        tick();
    }

    void Scheduler::onWorkerMessage(WorkerMessage const& message)
    {
        std::visit(
            Utility::overloaded{
                [this](ItemProgress const& progress) {
                    queue_->updateItem(progress.id, UploadPatch{.progress = progress.percent});
                },
                [this](ItemFinished const& finished) {
                    queue_->updateItem(finished.outcome.id, finished.outcome.toPatch());
                    if (shardItems_.erase(finished.outcome.id) > 0)
                    {
                        release(1);
                        tick();
                    }
                },
                [this](ShardFinished const& shard) {
                    Log::debug("Scheduler: Worker {} finished a shard of {} items.", shard.worker.value(), shard.itemCount);
                    tick();
                },
            },
            message);
    }
}
