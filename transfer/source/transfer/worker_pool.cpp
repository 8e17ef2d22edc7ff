#include <transfer/worker_pool.hpp>
#include <utility/overloaded.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <numeric>

namespace Transfer
{
    std::size_t shardConcurrency(std::vector<QueueItem> const& items)
    {
        if (items.empty())
            return 1;

        const auto totalSize =
            std::accumulate(items.begin(), items.end(), std::uint64_t{0}, [](std::uint64_t sum, QueueItem const& item) {
                auto const* upload = item.record.upload();
                return sum + (upload ? upload->size : 0);
            });
        const auto averageSize = totalSize / items.size();

        constexpr std::uint64_t megabyte = 1024 * 1024;
        std::size_t limit = 6;
        if (averageSize < 5 * megabyte)
            limit = 24;
        else if (averageSize < 20 * megabyte)
            limit = 16;
        else if (averageSize < 50 * megabyte)
            limit = 12;
        return std::min(limit, items.size());
    }

    WorkerPool::WorkerPool(
        Async::ProcessingThread& orchestrator,
        std::shared_ptr<NegotiationClient> negotiation,
        std::shared_ptr<IObjectStore> objectStore,
        Options options,
        MessageHandler onMessage)
        : orchestrator_{&orchestrator}
        , negotiation_{std::move(negotiation)}
        , objectStore_{std::move(objectStore)}
        , options_{std::move(options)}
        , onMessage_{std::move(onMessage)}
    {
        options_.job.commitIndividually = false;
        workers_.reserve(options_.workerCount);
        for (std::size_t i = 0; i != options_.workerCount; ++i)
            workers_.push_back(makeWorker());
        Log::info("WorkerPool: Started {} workers.", workers_.size());
    }

    WorkerPool::~WorkerPool()
    {
        shutdown();
    }

    std::unique_ptr<WorkerPool::Worker> WorkerPool::makeWorker()
    {
        auto worker = std::make_unique<Worker>();
        worker->id = Ids::generateWorkerId();
        worker->thread = std::make_unique<Async::ProcessingThread>();
        worker->thread->start(std::chrono::milliseconds{100});
        worker->reportStrand = orchestrator_->createStrand();
        return worker;
    }

    WorkerPool::Worker* WorkerPool::findWorker(Ids::WorkerId const& id)
    {
        auto iter = std::find_if(workers_.begin(), workers_.end(), [&id](auto const& worker) {
            return worker->id == id;
        });
        return iter == workers_.end() ? nullptr : iter->get();
    }

    std::size_t WorkerPool::idleWorkerCount() const
    {
        return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(), [](auto const& worker) {
            return !worker->busy;
        }));
    }

    std::size_t WorkerPool::busyWorkerCount() const
    {
        return workers_.size() - idleWorkerCount();
    }

    bool WorkerPool::dispatch(RunShard shard)
    {
        reapRetired(false);

        auto iter = std::find_if(workers_.begin(), workers_.end(), [](auto const& worker) {
            return !worker->busy;
        });
        if (iter == workers_.end())
            return false;

        auto& worker = **iter;
        worker.busy = true;
        worker.pendingItems.clear();
        worker.itemSignals.clear();
        shard.signals.clear();
        for (auto const& item : shard.items)
        {
            auto signal = worker.cancel.child();
            worker.pendingItems.push_back(item.record.id);
            worker.itemSignals.emplace(item.record.id, signal);
            shard.signals.push_back(std::move(signal));
        }

        auto report = [this, strand = worker.reportStrand, workerId = worker.id](WorkerMessage message) {
            strand->pushTask([this, workerId, message = std::move(message)]() {
                onWorkerMessage(workerId, message);
            });
        };

        Log::debug("WorkerPool: Worker {} takes a shard of {} items.", worker.id.value(), shard.items.size());
        const bool pushed = worker.thread->pushTask([shard = std::move(shard),
                                                     negotiation = negotiation_,
                                                     objectStore = objectStore_,
                                                     cancel = worker.cancel,
                                                     jobOptions = options_.job,
                                                     report = std::move(report),
                                                     workerId = worker.id]() mutable {
            runShard(std::move(shard), negotiation, objectStore, cancel, jobOptions, report, workerId);
        });
        if (!pushed)
        {
            Log::error("WorkerPool: Worker {} does not accept work.", worker.id.value());
            worker.busy = false;
            worker.pendingItems.clear();
            worker.itemSignals.clear();
            return false;
        }
        return true;
    }

    void WorkerPool::onWorkerMessage(Ids::WorkerId const& id, WorkerMessage const& message)
    {
        auto* worker = findWorker(id);
        if (!worker)
        {
            Log::debug("WorkerPool: Dropping message of abandoned worker {}.", id.value());
            return;
        }

        std::visit(
            Utility::overloaded{
                [](ItemProgress const&) {},
                [worker](ItemFinished const& finished) {
                    std::erase(worker->pendingItems, finished.outcome.id);
                    worker->itemSignals.erase(finished.outcome.id);
                },
                [worker](ShardFinished const&) {
                    worker->busy = false;
                    worker->pendingItems.clear();
                    worker->itemSignals.clear();
                },
            },
            message);
        onMessage_(message);
    }

    void WorkerPool::cancelAll()
    {
        for (auto& worker : workers_)
        {
            if (worker->busy)
                worker->cancel.cancel();
        }

        const auto deadline = std::chrono::steady_clock::now() + options_.cancelGracePeriod;
        for (auto& worker : workers_)
        {
            if (!worker->busy)
                continue;

            auto idle = worker->thread->pushPromiseTask([]() {});
            if (idle.wait_until(deadline) == std::future_status::ready)
            {
                // Stopped in time. Its messages are queued behind this task.
                worker->cancel = CancellationSignal{};
                worker->itemSignals.clear();
                continue;
            }

            Log::warn(
                "WorkerPool: Worker {} did not stop within {} ms, replacing it.",
                worker->id.value(),
                options_.cancelGracePeriod.count());
            worker->reportStrand->finalize();
            const auto abandonedId = worker->id;
            const auto pending = std::move(worker->pendingItems);
            retired_.push_back(RetiredWorker{.thread = std::move(worker->thread), .idle = std::move(idle)});
            worker = makeWorker();

            for (auto const& itemId : pending)
            {
                onMessage_(ItemFinished{
                    .outcome = JobOutcome{.id = itemId, .status = SharedData::UploadStatus::Cancelled},
                });
            }
            onMessage_(ShardFinished{.worker = abandonedId, .itemCount = pending.size()});
        }
    }

    bool WorkerPool::cancelItem(Ids::ItemId const& id)
    {
        for (auto& worker : workers_)
        {
            if (!worker->busy)
                continue;
            if (auto iter = worker->itemSignals.find(id); iter != worker->itemSignals.end())
            {
                iter->second.cancel();
                Log::debug("WorkerPool: Cancelled item {} on worker {}.", id.value(), worker->id.value());
                return true;
            }
        }
        return false;
    }

    void WorkerPool::reapRetired(bool wait)
    {
        std::erase_if(retired_, [wait](RetiredWorker& retired) {
            if (!wait && retired.idle.valid() &&
                retired.idle.wait_for(std::chrono::seconds{0}) != std::future_status::ready)
                return false;
            // Joins the thread.
            retired.thread.reset();
            return true;
        });
    }

    void WorkerPool::shutdown()
    {
        if (workers_.empty() && retired_.empty())
            return;

        for (auto& worker : workers_)
            worker->cancel.cancel();

        for (auto& worker : workers_)
        {
            worker->thread.reset();
            worker->reportStrand->finalize();
            for (auto const& itemId : worker->pendingItems)
            {
                onMessage_(ItemFinished{
                    .outcome = JobOutcome{.id = itemId, .status = SharedData::UploadStatus::Cancelled},
                });
            }
        }
        workers_.clear();
        reapRetired(true);
        Log::info("WorkerPool: Shut down.");
    }

    void WorkerPool::runShard(
        RunShard shard,
        std::shared_ptr<NegotiationClient> negotiation,
        std::shared_ptr<IObjectStore> objectStore,
        CancellationSignal cancel,
        TransferJob::Options jobOptions,
        std::function<void(WorkerMessage)> const& report,
        Ids::WorkerId const& worker)
    {
        const auto itemCount = shard.items.size();
        const auto concurrency = shardConcurrency(shard.items);
        std::vector<std::unique_ptr<TransferJob>> jobs{};
        std::vector<CancellationSignal> jobSignals{};
        std::vector<SharedData::DestinationRequest> requests{};
        jobs.reserve(itemCount);
        requests.reserve(itemCount);

        for (std::size_t i = 0; i != itemCount; ++i)
        {
            auto& item = shard.items[i];
            const auto itemId = item.record.id;
            const auto signal = i < shard.signals.size() ? shard.signals[i] : cancel;
            auto job = std::make_unique<TransferJob>(
                std::move(item),
                negotiation,
                objectStore,
                shard.encryption,
                signal,
                jobOptions,
                [&report, itemId](int percent) {
                    report(ItemProgress{.id = itemId, .percent = percent});
                });

            if (signal.isCancelled())
            {
                report(ItemFinished{.outcome = job->cancel()});
                continue;
            }
            auto request = job->prepare();
            if (!request.has_value())
            {
                report(ItemFinished{.outcome = job->outcome()});
                continue;
            }
            requests.push_back(std::move(request).value());
            jobs.push_back(std::move(job));
            jobSignals.push_back(signal);
        }

        if (!jobs.empty())
        {
            Log::debug("WorkerPool: Worker {} negotiates {} destinations.", worker.value(), requests.size());
            auto destinations = negotiation->requestDestinations(requests, cancel);
            for (std::size_t i = 0; i != jobs.size(); ++i)
            {
                if (i < destinations.size())
                    jobs[i]->adoptDestination(std::move(destinations[i]));
                else
                    jobs[i]->adoptDestination(std::unexpected(SharedData::TransferError{
                        .type = SharedData::TransferErrorType::Negotiation,
                        .message = "No destination returned",
                    }));
            }
        }

        std::vector<std::optional<JobOutcome>> outcomes(jobs.size());
        {
            boost::asio::thread_pool transfers{std::min(concurrency, std::max<std::size_t>(jobs.size(), 1))};
            for (std::size_t i = 0; i != jobs.size(); ++i)
            {
                if (jobs[i]->stage() != TransferStage::Negotiating)
                    continue;
                boost::asio::post(transfers, [&job = *jobs[i], &outcome = outcomes[i]]() {
                    outcome = job.run();
                });
            }
            transfers.join();
        }
        Log::debug(
            "WorkerPool: Worker {} transferred {} items, up to {} at once.", worker.value(), jobs.size(), concurrency);

        std::vector<TransferJob*> committing{};
        std::vector<Ids::FileId> fileIds{};
        for (std::size_t i = 0; i != jobs.size(); ++i)
        {
            auto& job = jobs[i];
            if (!outcomes[i])
            {
                report(ItemFinished{.outcome = job->outcome()});
                continue;
            }
            auto& outcome = *outcomes[i];
            if (job->awaitingCommit() && outcome.fileId && !jobSignals[i].isCancelled())
            {
                committing.push_back(job.get());
                fileIds.push_back(*outcome.fileId);
                continue;
            }
            report(ItemFinished{.outcome = job->awaitingCommit() ? job->cancel() : std::move(outcome)});
        }

        if (!committing.empty())
        {
            if (cancel.isCancelled())
            {
                for (auto* job : committing)
                    report(ItemFinished{.outcome = job->cancel()});
            }
            else
            {
                const auto result = negotiation->commitCompletion(fileIds, cancel);
                if (!result.has_value())
                    Log::error(
                        "WorkerPool: Worker {} could not commit {} files: {}",
                        worker.value(),
                        fileIds.size(),
                        result.error().toString());
                for (auto* job : committing)
                    report(ItemFinished{.outcome = job->settleCommit(result)});
            }
        }

        report(ShardFinished{.worker = worker, .itemCount = itemCount});
    }
}
