#pragma once

#include "records.hpp"

#include <persistence/journal_queue_store.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <string>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class JournalQueueStoreTests : public ::testing::Test
    {
      protected:
        std::filesystem::path journalPath() const
        {
            return temporaryDirectory_.path() / "queue.journal";
        }

        std::size_t countLines() const
        {
            std::ifstream reader{journalPath()};
            std::size_t lines = 0;
            std::string line;
            while (std::getline(reader, line))
                ++lines;
            return lines;
        }

      protected:
        Utility::TemporaryDirectory temporaryDirectory_{programDirectory / "temp", true};
    };

    TEST_F(JournalQueueStoreTests, MissingJournalIsAnEmptyStore)
    {
        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        EXPECT_TRUE(records->empty());
    }

    TEST_F(JournalQueueStoreTests, UsingStoreBeforeOpenFails)
    {
        JournalQueueStore store{journalPath()};
        auto result = store.put(makeUploadRecord(0, "a.txt"));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, StoreErrorType::NotOpen);
    }

    TEST_F(JournalQueueStoreTests, RecordsSurviveReopenInSequenceOrder)
    {
        auto first = makeUploadRecord(2, "second.txt");
        auto second = makeUploadRecord(1, "first.txt");
        {
            JournalQueueStore store{journalPath()};
            ASSERT_TRUE(store.open().has_value());
            ASSERT_TRUE(store.putMany({first, second}).has_value());
        }

        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 2);
        EXPECT_EQ((*records)[0].upload()->name, "first.txt");
        EXPECT_EQ((*records)[1].upload()->name, "second.txt");
        EXPECT_EQ((*records)[1].id, first.id);
    }

    TEST_F(JournalQueueStoreTests, LaterPutReplacesEarlierOne)
    {
        auto record = makeUploadRecord(0, "a.txt");
        {
            JournalQueueStore store{journalPath()};
            ASSERT_TRUE(store.open().has_value());
            ASSERT_TRUE(store.put(record).has_value());
            record.upload()->status = SharedData::UploadStatus::Failed;
            record.error = SharedData::TransferError{
                .type = SharedData::TransferErrorType::Transfer,
                .message = "Connection reset",
            };
            ASSERT_TRUE(store.put(record).has_value());
        }

        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 1);
        EXPECT_EQ((*records)[0].upload()->status, SharedData::UploadStatus::Failed);
        ASSERT_TRUE((*records)[0].error.has_value());
        EXPECT_EQ((*records)[0].error->message, "Connection reset");
    }

    TEST_F(JournalQueueStoreTests, RemoveAndClearAreReplayed)
    {
        auto a = makeUploadRecord(0, "a.txt");
        auto b = makeUploadRecord(1, "b.txt");
        auto c = makeUploadRecord(2, "c.txt");
        {
            JournalQueueStore store{journalPath()};
            ASSERT_TRUE(store.open().has_value());
            ASSERT_TRUE(store.putMany({a, b}).has_value());
            ASSERT_TRUE(store.clear().has_value());
            ASSERT_TRUE(store.putMany({a, c}).has_value());
            ASSERT_TRUE(store.remove(a.id).has_value());
        }

        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 1);
        EXPECT_EQ((*records)[0].id, c.id);
    }

    TEST_F(JournalQueueStoreTests, TornTrailingLineIsSkipped)
    {
        auto record = makeUploadRecord(0, "a.txt");
        {
            JournalQueueStore store{journalPath()};
            ASSERT_TRUE(store.open().has_value());
            ASSERT_TRUE(store.put(record).has_value());
        }
        {
            std::ofstream writer{journalPath(), std::ios_base::app};
            writer << R"({"op":"put","record":{"id":)";
        }

        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        EXPECT_EQ(store.skippedLineCount(), 1);
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 1);
        EXPECT_EQ((*records)[0].id, record.id);

        ASSERT_TRUE(store.put(makeUploadRecord(1, "b.txt")).has_value());
        EXPECT_EQ(countLines(), 2);
    }

    TEST_F(JournalQueueStoreTests, JournalIsCompactedWhenItGrowsTooLong)
    {
        auto record = makeUploadRecord(0, "a.txt");
        JournalQueueStore store{journalPath(), 4};
        ASSERT_TRUE(store.open().has_value());
        for (int progress = 0; progress <= 100; ++progress)
        {
            record.upload()->progress = progress;
            ASSERT_TRUE(store.put(record).has_value());
        }

        EXPECT_LE(store.journalLineCount(), JournalQueueStore::minimumCompactionLines);
        EXPECT_EQ(countLines(), store.journalLineCount());

        JournalQueueStore reopened{journalPath()};
        ASSERT_TRUE(reopened.open().has_value());
        auto records = reopened.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 1);
        EXPECT_EQ((*records)[0].upload()->progress, 100);
    }

    TEST_F(JournalQueueStoreTests, DeleteRecordsAreStored)
    {
        const auto now = std::chrono::system_clock::now();
        SharedData::QueueRecord record{
            .id = Ids::generateItemId(),
            .sequence = 7,
            .createdAt = now,
            .updatedAt = now,
            .body =
                SharedData::DeleteRecord{
                    .targets = {Ids::makeFileId("11"), Ids::makeFileId("12")},
                    .totalFiles = 2,
                    .completedFiles = 1,
                },
        };
        {
            JournalQueueStore store{journalPath()};
            ASSERT_TRUE(store.open().has_value());
            ASSERT_TRUE(store.put(record).has_value());
        }

        JournalQueueStore store{journalPath()};
        ASSERT_TRUE(store.open().has_value());
        auto records = store.getAll();
        ASSERT_TRUE(records.has_value());
        ASSERT_EQ(records->size(), 1);
        ASSERT_NE((*records)[0].deletion(), nullptr);
        EXPECT_EQ((*records)[0].kind(), SharedData::OperationKind::Delete);
        EXPECT_EQ((*records)[0].deletion()->targets.size(), 2);
        EXPECT_EQ((*records)[0].deletion()->completedFiles, 1);
    }
}
