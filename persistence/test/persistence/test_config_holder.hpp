#pragma once

#include <persistence/config_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class ConfigHolderTests : public ::testing::Test
    {
      protected:
        std::filesystem::path configPath() const
        {
            return temporaryDirectory_.path() / "config.json";
        }

        void writeConfig(std::string const& content) const
        {
            std::ofstream writer{configPath(), std::ios_base::binary};
            writer << content;
        }

        nlohmann::json readConfig() const
        {
            std::ifstream reader{configPath(), std::ios_base::binary};
            return nlohmann::json::parse(reader);
        }

        std::size_t countBackups() const
        {
            std::size_t count = 0;
            for (auto const& entry : std::filesystem::directory_iterator{temporaryDirectory_.path()})
            {
                if (entry.path().filename().string().starts_with("config.json.backup_"))
                    ++count;
            }
            return count;
        }

      protected:
        Utility::TemporaryDirectory temporaryDirectory_{programDirectory / "temp", true};
    };

    TEST_F(ConfigHolderTests, MissingFileIsCreatedWithDefaults)
    {
        ConfigHolder holder{configPath()};
        ASSERT_TRUE(holder.load());
        ASSERT_TRUE(std::filesystem::exists(configPath()));

        const auto json = readConfig();
        EXPECT_EQ(json["transfer"]["concurrency"].get<int>(), 24);
        EXPECT_EQ(json["transfer"]["retry"]["maxAttempts"].get<int>(), 3);
        EXPECT_EQ(json["queue"]["maxRetainedItems"].get<std::size_t>(), 10'000);
        EXPECT_EQ(holder.stateCache().limits.maxNameLength.value(), 255);
    }

    TEST_F(ConfigHolderTests, UserValuesAreKeptAndGapsAreFilled)
    {
        writeConfig(R"({
            // comments are allowed
            "transfer": {"concurrency": 2, "retry": {"maxAttempts": 7}},
            "backend": {"baseUrl": "https://example.org/api"}
        })");

        ConfigHolder holder{configPath()};
        ASSERT_TRUE(holder.load());
        auto const& state = holder.stateCache();
        EXPECT_EQ(state.transfer.concurrency.value(), 2);
        EXPECT_EQ(state.transfer.retry->maxAttempts.value(), 7);
        EXPECT_EQ(state.transfer.retry->backoffMilliseconds.value(), 500);
        EXPECT_EQ(state.transfer.shardSize.value(), 50);
        EXPECT_EQ(state.backend.baseUrl.value(), "https://example.org/api");
        EXPECT_EQ(state.backend.commitPath.value(), "/uppy/upload-complete/");

        const auto json = readConfig();
        EXPECT_EQ(json["transfer"]["concurrency"].get<int>(), 2);
        EXPECT_TRUE(json["transfer"].contains("shardThreshold"));
        EXPECT_EQ(countBackups(), 0);
    }

    TEST_F(ConfigHolderTests, CorruptFileIsBackedUpAndReplacedByDefaults)
    {
        writeConfig("{ this is not json");

        ConfigHolder holder{configPath()};
        ASSERT_TRUE(holder.load());
        EXPECT_EQ(countBackups(), 1);
        EXPECT_EQ(holder.stateCache().transfer.concurrency.value(), 24);
        EXPECT_NO_THROW(readConfig());
    }

    TEST_F(ConfigHolderTests, SavedChangesAreLoadedAgain)
    {
        {
            ConfigHolder holder{configPath()};
            ASSERT_TRUE(holder.load());
            holder.stateCache().queue.autoRemoveCompleted = true;
            holder.stateCache().log.level = Log::Level::Debug;
            ASSERT_TRUE(holder.save().has_value());
        }

        ConfigHolder holder{configPath()};
        ASSERT_TRUE(holder.load());
        EXPECT_TRUE(holder.stateCache().queue.autoRemoveCompleted.value());
        EXPECT_EQ(holder.stateCache().log.level.value(), Log::Level::Debug);
    }
}
