#pragma once

#include <persistence/queue_store.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_map>

namespace Persistence
{
    /**
     * @brief Append only JSON lines journal. Every line is one of
     * {"op":"put","record":{...}}, {"op":"remove","id":"..."} or {"op":"clear"}.
     * The journal is replayed on open and rewritten through a temporary file once
     * it holds more than compactionFactor lines per live record.
     */
    class JournalQueueStore : public IQueueStore
    {
      public:
        constexpr static std::size_t minimumCompactionLines = 64;

        JournalQueueStore(std::filesystem::path path, std::size_t compactionFactor = 4);
        ~JournalQueueStore() override;
        JournalQueueStore(JournalQueueStore const&) = delete;
        JournalQueueStore& operator=(JournalQueueStore const&) = delete;
        JournalQueueStore(JournalQueueStore&&) = delete;
        JournalQueueStore& operator=(JournalQueueStore&&) = delete;

        /**
         * @brief Replays the journal. A missing journal is an empty store.
         */
        std::expected<void, StoreError> open();
        void close();

        std::expected<void, StoreError> put(SharedData::QueueRecord const& record) override;
        std::expected<void, StoreError> putMany(std::vector<SharedData::QueueRecord> const& records) override;
        std::expected<std::vector<SharedData::QueueRecord>, StoreError> getAll() override;
        std::expected<void, StoreError> remove(Ids::ItemId const& id) override;
        std::expected<void, StoreError> removeMany(std::vector<Ids::ItemId> const& ids) override;
        std::expected<void, StoreError> clear() override;

        /**
         * @brief Rewrites the journal so that it only holds the live records.
         */
        std::expected<void, StoreError> compact();

        std::size_t journalLineCount() const;
        std::size_t skippedLineCount() const;

      private:
        std::expected<void, StoreError> appendLines(std::vector<nlohmann::json> const& lines);
        std::expected<void, StoreError> compactIfNeeded();
        std::expected<void, StoreError> compactLocked();
        std::expected<void, StoreError> openWriterLocked();
        void apply(nlohmann::json const& line);

      private:
        std::filesystem::path path_;
        std::size_t compactionFactor_;
        mutable std::mutex mutex_{};
        std::ofstream writer_{};
        bool open_{false};
        std::unordered_map<Ids::ItemId, SharedData::QueueRecord, Ids::IdHash> live_{};
        std::size_t journalLines_{0};
        std::size_t skippedLines_{0};
    };
}
