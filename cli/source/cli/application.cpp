#include <cli/application.hpp>
#include <cli/metadata_sidecar.hpp>
#include <crypto/encryption_pipeline.hpp>
#include <persistence/journal_queue_store.hpp>
#include <transfer/http_backend_api.hpp>
#include <transfer/local_scan.hpp>
#include <transfer/presigned_post_store.hpp>
#include <utility/format_bytes.hpp>
#include <log/log.hpp>

#include <fmt/format.h>
#include <roar/filesystem/special_paths.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iterator>
#include <cstdio>
#include <map>
#include <set>
#include <tuple>

namespace Cli
{
    namespace
    {
        std::atomic_int interrupts{0};

        void onInterrupt(int)
        {
            ++interrupts;
        }

        using PayloadKey = std::tuple<std::string, std::string, std::uint64_t>;

        PayloadKey keyOf(std::string const& destination, std::string const& name, std::uint64_t size)
        {
            return {destination, name, size};
        }

        std::string describeRecord(SharedData::QueueRecord const& record)
        {
            std::string line{};
            if (auto const* upload = record.upload())
            {
                line = fmt::format(
                    "{}  upload  {:<10} {:>3}%  {}/{} ({})",
                    record.id.value(),
                    Utility::enumToString(upload->status),
                    upload->progress,
                    upload->destinationPath,
                    upload->name,
                    Utility::formatBytes(upload->size));
                if (upload->fileId)
                    line += fmt::format(" -> file {}", upload->fileId->value());
            }
            else if (auto const* deletion = record.deletion())
            {
                line = fmt::format(
                    "{}  delete  {:<10} {:>3}%  {}/{} files, {} failed",
                    record.id.value(),
                    Utility::enumToString(deletion->status),
                    deletion->progress,
                    deletion->completedFiles,
                    deletion->totalFiles,
                    deletion->failedFiles);
            }
            if (record.error)
                line += fmt::format("  [{}]", record.error->toString());
            return line;
        }
    }

    Application::Application(CommandLine commandLine)
        : commandLine_{std::move(commandLine)}
        , config_{commandLine_.configPath}
        , store_{}
        , engine_{}
    {}

    Application::~Application()
    {
        stopEngine();
    }

    int Application::run()
    {
        switch (commandLine_.command)
        {
            case Command::Help:
                fmt::print("{}", usage());
                return 0;
            case Command::Encrypt:
                return encrypt();
            case Command::Decrypt:
                return decrypt();
            default:
                break;
        }

        if (!loadConfiguration())
            return 1;

        switch (commandLine_.command)
        {
            case Command::Upload:
                return upload();
            case Command::Delete:
                return remove();
            case Command::Status:
                return status();
            case Command::Clear:
                return clear();
            default:
                return 1;
        }
    }

    bool Application::loadConfiguration()
    {
        if (!config_.load())
        {
            fmt::print(stderr, "Could not load configuration from '{}'.\n", config_.path().string());
            return false;
        }
        commandLine_.applyTo(config_.stateCache());
        setupLogging();
        Log::debug("Application: Using configuration '{}'.", config_.path().string());
        return true;
    }

    void Application::setupLogging() const
    {
        auto const& logOptions = config_.stateCache().log;
        Log::SinkOptions sinks{
            .level = logOptions.level.value_or(Log::Level::Info),
            .console = true,
        };
        if (logOptions.file)
            sinks.file = Roar::resolvePath(*logOptions.file);
        Log::setupLogger(sinks);
    }

    std::filesystem::path Application::journalPath() const
    {
        auto const& queue = config_.stateCache().queue;
        return Roar::resolvePath(queue.journalPath.value_or("~/.vaultline/queue.journal"));
    }

    std::expected<void, std::string> Application::createEngine()
    {
        auto const& state = config_.stateCache();

        auto journal = std::make_shared<Persistence::JournalQueueStore>(
            journalPath(), state.queue.compactionFactor.value_or(4));
        if (auto result = journal->open(); !result)
            return std::unexpected(result.error().toString());
        store_ = std::make_shared<Persistence::AsyncQueueStore>(journal);

        auto baseUrl = Transfer::Http::Url::parse(state.backend.baseUrl.value_or(""));
        if (!baseUrl)
            return std::unexpected(fmt::format("Invalid backend url: {}", baseUrl.error()));

        Transfer::HttpBackendApi::Options backendOptions{
            .baseUrl = std::move(baseUrl).value(),
            .token = state.backend.token,
        };
        if (state.backend.timeoutSeconds)
            backendOptions.timeout = std::chrono::seconds{*state.backend.timeoutSeconds};
        if (state.backend.negotiatePath)
            backendOptions.negotiatePath = *state.backend.negotiatePath;
        if (state.backend.commitPath)
            backendOptions.commitPath = *state.backend.commitPath;
        if (state.backend.deletePath)
            backendOptions.deletePath = *state.backend.deletePath;

        engine_ = std::make_unique<Transfer::TransferEngine>(
            Transfer::TransferEngine::Options::fromState(state),
            store_,
            std::make_shared<Transfer::HttpBackendApi>(std::move(backendOptions)),
            std::make_shared<Transfer::PresignedPostStore>());
        return {};
    }

    void Application::stopEngine()
    {
        if (engine_)
        {
            engine_->shutdown();
            engine_.reset();
        }
        if (store_)
        {
            store_->flush();
            store_.reset();
        }
    }

    void Application::waitForEngine()
    {
        interrupts = 0;
        auto previous = std::signal(SIGINT, &onInterrupt);

        bool cancelled = false;
        while (!engine_->waitUntilIdle(std::chrono::milliseconds{200}))
        {
            const auto count = interrupts.load();
            if (count == 1 && !cancelled)
            {
                Log::warn("Application: Interrupted, cancelling all uploads. Interrupt again to stop deletions.");
                engine_->cancelAll();
                cancelled = true;
            }
            else if (count > 1)
            {
                // shutdown settles whatever is still running
                Log::warn("Application: Interrupted twice, stopping.");
                break;
            }
        }

        std::signal(SIGINT, previous);
    }

    void Application::printProgress(SharedData::QueueSnapshot const& snapshot) const
    {
        if (commandLine_.quiet)
            return;

        if (snapshot.sessionActive || snapshot.uploadTotal > 0)
        {
            fmt::print(
                stderr,
                "\ruploads: {}/{} done, {} failed, {} active, {}%   ",
                snapshot.uploadCompleted,
                snapshot.uploadTotal,
                snapshot.uploadFailed,
                snapshot.uploadInProgress,
                snapshot.percentage);
        }
        for (auto const& deletion : snapshot.deleteOperations)
        {
            fmt::print(
                stderr,
                "\rdelete: {}/{} files   ",
                deletion.completedFiles.value_or(0),
                deletion.totalFiles.value_or(0));
        }
    }

    int Application::upload()
    {
        std::vector<std::filesystem::path> inputs{};
        std::transform(
            commandLine_.arguments.begin(),
            commandLine_.arguments.end(),
            std::back_inserter(inputs),
            [](std::string const& argument) {
                return Roar::resolvePath(argument);
            });

        auto groups = Transfer::collectUploads(inputs, commandLine_.destination);
        if (!groups)
        {
            fmt::print(stderr, "{}\n", groups.error().toString());
            return 1;
        }

        if (auto result = createEngine(); !result)
        {
            fmt::print(stderr, "{}\n", result.error());
            return 1;
        }

        if (commandLine_.secret)
        {
            if (auto result = engine_->setEncryptionSecret(*commandLine_.secret); !result)
            {
                fmt::print(stderr, "{}\n", result.error().toString());
                return 1;
            }
        }

        // Uploads left over from an interrupted run of the same command are resumed instead of added twice.
        std::map<PayloadKey, std::vector<std::shared_ptr<Transfer::IPayload>>> candidates{};
        std::set<Transfer::IPayload const*> resumed{};
        std::size_t total = 0;
        for (auto const& group : *groups)
        {
            for (auto const& payload : group.payloads)
                candidates[keyOf(group.destinationPath, payload->name(), payload->size())].push_back(payload);
            total += group.payloads.size();
        }

        auto resolve = [&](SharedData::QueueRecord const& record) -> std::shared_ptr<Transfer::IPayload> {
            auto const* upload = record.upload();
            if (upload == nullptr)
                return nullptr;
            auto iter = candidates.find(keyOf(upload->destinationPath, upload->name, upload->size));
            if (iter == candidates.end() || iter->second.empty())
                return nullptr;
            auto payload = iter->second.back();
            iter->second.pop_back();
            resumed.insert(payload.get());
            return payload;
        };
        // Nothing is scheduled before the session exists, so resumed uploads count in its summary.
        if (auto initResult = engine_->init(resolve, true); !initResult)
        {
            fmt::print(stderr, "{}\n", initResult.error().toString());
            return 1;
        }
        if (!resumed.empty())
            Log::info("Application: Resuming {} uploads from a previous run.", resumed.size());

        const auto session = engine_->startSession(total);
        Log::debug("Application: Upload session {} with {} files.", session.value(), total);
        auto unsubscribe = engine_->subscribe([this](SharedData::QueueSnapshot const& snapshot) {
            printProgress(snapshot);
        });

        int exitCode = 0;
        for (auto const& group : *groups)
        {
            std::vector<std::shared_ptr<Transfer::IPayload>> payloads{};
            for (auto const& payload : group.payloads)
            {
                if (!resumed.contains(payload.get()))
                    payloads.push_back(payload);
            }
            if (payloads.empty())
                continue;

            auto ids = engine_->enqueueBatch(payloads, group.destinationPath);
            if (!ids)
            {
                fmt::print(stderr, "'{}': {}\n", group.destinationPath, ids.error().toString());
                exitCode = 1;
            }
        }
        engine_->resume();

        waitForEngine();
        engine_->shutdown();
        unsubscribe();

        const auto summary = engine_->endSession();
        if (!commandLine_.quiet)
            fmt::print(stderr, "\n");

        for (auto const& item : engine_->snapshot().items)
        {
            if (item.kind == SharedData::OperationKind::Upload && item.error)
                fmt::print(stderr, "{}/{}: {}\n", item.destinationPath, item.name, *item.error);
        }
        if (summary)
        {
            fmt::print(
                "{} uploaded, {} failed, {} cancelled.\n", summary->completed, summary->failed, summary->cancelled);
            if (summary->failed > 0 || summary->cancelled > 0)
                exitCode = 1;
        }
        return exitCode;
    }

    int Application::remove()
    {
        if (auto result = createEngine(); !result)
        {
            fmt::print(stderr, "{}\n", result.error());
            return 1;
        }
        if (auto result = engine_->init(); !result)
        {
            fmt::print(stderr, "{}\n", result.error().toString());
            return 1;
        }

        std::vector<Ids::FileId> targets{};
        std::transform(
            commandLine_.arguments.begin(),
            commandLine_.arguments.end(),
            std::back_inserter(targets),
            [](std::string const& argument) {
                return Ids::makeFileId(argument);
            });

        auto unsubscribe = engine_->subscribe([this](SharedData::QueueSnapshot const& snapshot) {
            printProgress(snapshot);
        });
        const auto id = engine_->addDeleteOperation(std::move(targets));

        waitForEngine();
        const auto snapshot = engine_->snapshot();
        engine_->shutdown();
        unsubscribe();
        if (!commandLine_.quiet)
            fmt::print(stderr, "\n");

        auto const& deletions = snapshot.deleteOperations;
        auto iter = std::find_if(deletions.begin(), deletions.end(), [&id](auto const& view) {
            return view.id == id;
        });
        if (iter == deletions.end())
        {
            fmt::print(stderr, "Delete operation {} is gone.\n", id.value());
            return 1;
        }
        fmt::print(
            "delete {}: {} of {} files processed.\n",
            iter->status,
            iter->completedFiles.value_or(0),
            iter->totalFiles.value_or(0));
        if (iter->error)
        {
            fmt::print(stderr, "{}\n", *iter->error);
            return 1;
        }
        return iter->status == Utility::enumToString(SharedData::DeleteStatus::Completed) ? 0 : 1;
    }

    int Application::status()
    {
        Persistence::JournalQueueStore journal{journalPath()};
        if (auto result = journal.open(); !result)
        {
            fmt::print(stderr, "{}\n", result.error().toString());
            return 1;
        }
        auto records = journal.getAll();
        if (!records)
        {
            fmt::print(stderr, "{}\n", records.error().toString());
            return 1;
        }
        if (records->empty())
        {
            fmt::print("The queue is empty.\n");
            return 0;
        }
        for (auto const& record : *records)
            fmt::print("{}\n", describeRecord(record));
        return 0;
    }

    int Application::clear()
    {
        Persistence::JournalQueueStore journal{journalPath()};
        if (auto result = journal.open(); !result)
        {
            fmt::print(stderr, "{}\n", result.error().toString());
            return 1;
        }
        if (auto result = journal.clear(); !result)
        {
            fmt::print(stderr, "{}\n", result.error().toString());
            return 1;
        }
        fmt::print("Queue cleared.\n");
        return 0;
    }

    int Application::encrypt()
    {
        if (!commandLine_.secret)
        {
            fmt::print(stderr, "encrypt needs --secret or VAULTLINE_SECRET.\n");
            return 1;
        }

        const auto source = Roar::resolvePath(commandLine_.arguments.front());
        auto target = commandLine_.output ? Roar::resolvePath(*commandLine_.output) : source;
        if (!commandLine_.output)
            target += ".enc";

        Crypto::EncryptionPipeline pipeline{};
        auto metadata = pipeline.encryptFile(source, target, *commandLine_.secret);
        if (!metadata)
        {
            fmt::print(stderr, "{}\n", metadata.error().toString());
            return 1;
        }
        if (auto result = writeMetadataSidecar(target, *metadata); !result)
        {
            fmt::print(stderr, "{}\n", result.error());
            return 1;
        }
        fmt::print("{} -> {}\n", source.string(), target.string());
        return 0;
    }

    int Application::decrypt()
    {
        if (!commandLine_.secret)
        {
            fmt::print(stderr, "decrypt needs --secret or VAULTLINE_SECRET.\n");
            return 1;
        }

        const auto source = Roar::resolvePath(commandLine_.arguments.front());
        auto metadata = readMetadataSidecar(source);
        if (!metadata)
        {
            fmt::print(stderr, "{}\n", metadata.error());
            return 1;
        }

        std::filesystem::path target{};
        if (commandLine_.output)
            target = Roar::resolvePath(*commandLine_.output);
        else
        {
            target = source.parent_path() / std::filesystem::path{metadata->originalMetadata.originalName}.filename();
            std::error_code ec;
            if (std::filesystem::exists(target, ec) || target == source)
            {
                fmt::print(stderr, "'{}' exists, choose a target with --output.\n", target.string());
                return 1;
            }
        }

        Crypto::EncryptionPipeline pipeline{};
        if (auto result = pipeline.decryptFile(source, *metadata, target, *commandLine_.secret); !result)
        {
            fmt::print(stderr, "{}\n", result.error().toString());
            return 1;
        }
        fmt::print("{} -> {}\n", source.string(), target.string());
        return 0;
    }
}
