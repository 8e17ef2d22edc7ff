#include <persistence/journal_queue_store.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Persistence
{
    JournalQueueStore::JournalQueueStore(std::filesystem::path path, std::size_t compactionFactor)
        : path_{std::move(path)}
        , compactionFactor_{std::max<std::size_t>(compactionFactor, 2)}
    {}

    JournalQueueStore::~JournalQueueStore()
    {
        close();
    }

    std::expected<void, StoreError> JournalQueueStore::open()
    {
        std::scoped_lock lock{mutex_};
        live_.clear();
        journalLines_ = 0;
        skippedLines_ = 0;

        try
        {
            if (const auto parent = path_.parent_path(); !parent.empty())
                std::filesystem::create_directories(parent);
        }
        catch (std::exception const& e)
        {
            return std::unexpected(StoreError{.type = StoreErrorType::OpenFailed, .message = e.what()});
        }

        if (std::filesystem::exists(path_))
        {
            std::ifstream reader{path_, std::ios_base::binary};
            if (!reader.good())
                return std::unexpected(
                    StoreError{.type = StoreErrorType::ReadFailed, .message = "Cannot read " + path_.string()});

            std::string line{};
            std::size_t lineNumber = 0;
            while (std::getline(reader, line))
            {
                ++lineNumber;
                if (line.empty())
                    continue;
                try
                {
                    apply(nlohmann::json::parse(line));
                    ++journalLines_;
                }
                catch (std::exception const& e)
                {
                    // A crash while appending leaves a torn last line behind.
                    Log::warn("JournalQueueStore: Skipping unreadable line {} of '{}': {}", lineNumber, path_.string(), e.what());
                    ++skippedLines_;
                }
            }
        }

        Log::info("JournalQueueStore: Replayed {} records from '{}'.", live_.size(), path_.string());

        if (skippedLines_ > 0)
        {
            // Rewrite so that a torn tail does not glue onto the next append.
            if (auto result = compactLocked(); !result)
                return result;
        }
        else if (auto result = openWriterLocked(); !result)
            return result;

        open_ = true;
        return {};
    }

    void JournalQueueStore::close()
    {
        std::scoped_lock lock{mutex_};
        if (writer_.is_open())
        {
            writer_.flush();
            writer_.close();
        }
        open_ = false;
    }

    std::expected<void, StoreError> JournalQueueStore::openWriterLocked()
    {
        if (writer_.is_open())
            writer_.close();
        writer_.open(path_, std::ios_base::binary | std::ios_base::app);
        if (!writer_.good())
            return std::unexpected(
                StoreError{.type = StoreErrorType::OpenFailed, .message = "Cannot open " + path_.string()});
        return {};
    }

    void JournalQueueStore::apply(nlohmann::json const& line)
    {
        const auto op = line.at("op").get<std::string>();
        if (op == "put")
        {
            auto record = line.at("record").get<SharedData::QueueRecord>();
            auto id = record.id;
            live_.insert_or_assign(std::move(id), std::move(record));
        }
        else if (op == "remove")
            live_.erase(line.at("id").get<Ids::ItemId>());
        else if (op == "clear")
            live_.clear();
        else
            throw std::invalid_argument("Unknown journal operation: " + op);
    }

    std::expected<void, StoreError> JournalQueueStore::appendLines(std::vector<nlohmann::json> const& lines)
    {
        std::scoped_lock lock{mutex_};
        if (!open_)
            return std::unexpected(StoreError{.type = StoreErrorType::NotOpen, .message = path_.string()});

        for (auto const& line : lines)
        {
            apply(line);
            writer_ << line.dump() << '\n';
            ++journalLines_;
        }
        writer_.flush();
        if (!writer_.good())
            return std::unexpected(
                StoreError{.type = StoreErrorType::WriteFailed, .message = "Cannot append to " + path_.string()});

        return compactIfNeeded();
    }

    std::expected<void, StoreError> JournalQueueStore::put(SharedData::QueueRecord const& record)
    {
        return appendLines({nlohmann::json{{"op", "put"}, {"record", record}}});
    }

    std::expected<void, StoreError> JournalQueueStore::putMany(std::vector<SharedData::QueueRecord> const& records)
    {
        std::vector<nlohmann::json> lines{};
        lines.reserve(records.size());
        for (auto const& record : records)
            lines.push_back(nlohmann::json{{"op", "put"}, {"record", record}});
        return appendLines(lines);
    }

    std::expected<std::vector<SharedData::QueueRecord>, StoreError> JournalQueueStore::getAll()
    {
        std::scoped_lock lock{mutex_};
        if (!open_)
            return std::unexpected(StoreError{.type = StoreErrorType::NotOpen, .message = path_.string()});

        std::vector<SharedData::QueueRecord> records{};
        records.reserve(live_.size());
        for (auto const& [_, record] : live_)
            records.push_back(record);
        std::sort(records.begin(), records.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.sequence < rhs.sequence;
        });
        return records;
    }

    std::expected<void, StoreError> JournalQueueStore::remove(Ids::ItemId const& id)
    {
        return appendLines({nlohmann::json{{"op", "remove"}, {"id", id}}});
    }

    std::expected<void, StoreError> JournalQueueStore::removeMany(std::vector<Ids::ItemId> const& ids)
    {
        std::vector<nlohmann::json> lines{};
        lines.reserve(ids.size());
        for (auto const& id : ids)
            lines.push_back(nlohmann::json{{"op", "remove"}, {"id", id}});
        return appendLines(lines);
    }

    std::expected<void, StoreError> JournalQueueStore::clear()
    {
        std::scoped_lock lock{mutex_};
        if (!open_)
            return std::unexpected(StoreError{.type = StoreErrorType::NotOpen, .message = path_.string()});
        live_.clear();
        return compactLocked();
    }

    std::expected<void, StoreError> JournalQueueStore::compact()
    {
        std::scoped_lock lock{mutex_};
        return compactLocked();
    }

    std::expected<void, StoreError> JournalQueueStore::compactIfNeeded()
    {
        const auto threshold = std::max(live_.size() * compactionFactor_, minimumCompactionLines);
        if (journalLines_ <= threshold)
            return {};
        return compactLocked();
    }

    std::expected<void, StoreError> JournalQueueStore::compactLocked()
    {
        const auto temporary = std::filesystem::path{path_.string() + ".tmp"};
        try
        {
            {
                std::ofstream out{temporary, std::ios_base::binary | std::ios_base::trunc};
                if (!out.good())
                    return std::unexpected(StoreError{
                        .type = StoreErrorType::CompactionFailed, .message = "Cannot write " + temporary.string()});

                std::vector<SharedData::QueueRecord const*> ordered{};
                ordered.reserve(live_.size());
                for (auto const& [_, record] : live_)
                    ordered.push_back(&record);
                std::sort(ordered.begin(), ordered.end(), [](auto const* lhs, auto const* rhs) {
                    return lhs->sequence < rhs->sequence;
                });
                for (auto const* record : ordered)
                    out << nlohmann::json{{"op", "put"}, {"record", *record}}.dump() << '\n';
                out.flush();
                if (!out.good())
                    return std::unexpected(StoreError{
                        .type = StoreErrorType::CompactionFailed, .message = "Short write to " + temporary.string()});
            }

            if (writer_.is_open())
                writer_.close();
            std::filesystem::rename(temporary, path_);
        }
        catch (std::exception const& e)
        {
            return std::unexpected(StoreError{.type = StoreErrorType::CompactionFailed, .message = e.what()});
        }

        Log::debug("JournalQueueStore: Compacted '{}' from {} to {} lines.", path_.string(), journalLines_, live_.size());
        journalLines_ = live_.size();
        return openWriterLocked();
    }

    std::size_t JournalQueueStore::journalLineCount() const
    {
        std::scoped_lock lock{mutex_};
        return journalLines_;
    }
    std::size_t JournalQueueStore::skippedLineCount() const
    {
        std::scoped_lock lock{mutex_};
        return skippedLines_;
    }
}
