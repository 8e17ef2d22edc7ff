#pragma once

#include <cli/command_line.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>
#include <initializer_list>

namespace Cli::Test
{
    class CommandLineTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            ::unsetenv("VAULTLINE_SECRET");
        }

        static std::expected<CommandLine, std::string> parse(std::initializer_list<char const*> arguments)
        {
            std::vector<char const*> argv{"vaultline"};
            argv.insert(argv.end(), arguments.begin(), arguments.end());
            return parseCommandLine(static_cast<int>(argv.size()), argv.data());
        }
    };

    TEST_F(CommandLineTests, NoArgumentsMeansHelp)
    {
        auto commandLine = parse({});
        ASSERT_TRUE(commandLine.has_value()) << commandLine.error();
        EXPECT_EQ(commandLine->command, Command::Help);
    }

    TEST_F(CommandLineTests, UploadTakesPathsAndOptions)
    {
        auto commandLine =
            parse({"upload", "a.txt", "photos", "-d", "backup/2024", "--concurrency", "4", "--secret", "hunter22"});

        ASSERT_TRUE(commandLine.has_value()) << commandLine.error();
        EXPECT_EQ(commandLine->command, Command::Upload);
        EXPECT_THAT(commandLine->arguments, ::testing::ElementsAre("a.txt", "photos"));
        EXPECT_EQ(commandLine->destination, "backup/2024");
        EXPECT_EQ(commandLine->concurrency, 4);
        EXPECT_EQ(commandLine->secret, "hunter22");
        EXPECT_FALSE(commandLine->quiet);
    }

    TEST_F(CommandLineTests, CommandNamesAreCaseInsensitive)
    {
        auto commandLine = parse({"STATUS"});
        ASSERT_TRUE(commandLine.has_value()) << commandLine.error();
        EXPECT_EQ(commandLine->command, Command::Status);
    }

    TEST_F(CommandLineTests, UnknownCommandIsRejected)
    {
        auto commandLine = parse({"teleport"});
        ASSERT_FALSE(commandLine.has_value());
        EXPECT_THAT(commandLine.error(), ::testing::HasSubstr("teleport"));
    }

    TEST_F(CommandLineTests, UnknownOptionIsRejected)
    {
        EXPECT_FALSE(parse({"status", "--no-such-option"}).has_value());
    }

    TEST_F(CommandLineTests, ArgumentCountsAreChecked)
    {
        EXPECT_FALSE(parse({"upload"}).has_value());
        EXPECT_FALSE(parse({"delete"}).has_value());
        EXPECT_FALSE(parse({"encrypt"}).has_value());
        EXPECT_FALSE(parse({"decrypt", "a", "b"}).has_value());
        EXPECT_FALSE(parse({"clear", "now"}).has_value());
        EXPECT_TRUE(parse({"delete", "12", "13"}).has_value());
    }

    TEST_F(CommandLineTests, UnknownLogLevelIsRejected)
    {
        EXPECT_FALSE(parse({"status", "--log-level", "chatty"}).has_value());
        EXPECT_TRUE(parse({"status", "--log-level", "WARN"}).has_value());
    }

    TEST_F(CommandLineTests, ConcurrencyMustBePositive)
    {
        EXPECT_FALSE(parse({"status", "--concurrency", "0"}).has_value());
    }

    TEST_F(CommandLineTests, SecretFallsBackToTheEnvironment)
    {
        ::setenv("VAULTLINE_SECRET", "from-environment", 1);
        auto fromEnvironment = parse({"encrypt", "file.bin"});
        auto fromFlag = parse({"encrypt", "file.bin", "--secret", "from-flag-1"});
        ::unsetenv("VAULTLINE_SECRET");

        ASSERT_TRUE(fromEnvironment.has_value());
        EXPECT_EQ(fromEnvironment->secret, "from-environment");
        ASSERT_TRUE(fromFlag.has_value());
        EXPECT_EQ(fromFlag->secret, "from-flag-1");
    }

    TEST_F(CommandLineTests, FlagsOverrideTheConfiguration)
    {
        auto commandLine = parse(
            {"status",
             "--base-url",
             "https://example.org/api",
             "--token",
             "abc",
             "--log-level",
             "debug",
             "--log-file",
             "/tmp/vaultline.log",
             "-n",
             "7"});
        ASSERT_TRUE(commandLine.has_value()) << commandLine.error();

        auto state = Persistence::State::defaults();
        commandLine->applyTo(state);

        EXPECT_EQ(state.backend.baseUrl, "https://example.org/api");
        EXPECT_EQ(state.backend.token, "abc");
        EXPECT_EQ(state.log.level, Log::Level::Debug);
        EXPECT_EQ(state.log.file, "/tmp/vaultline.log");
        EXPECT_EQ(state.transfer.concurrency, 7);
        EXPECT_EQ(state.transfer.workerCount, Persistence::State::defaults().transfer.workerCount);
    }

    TEST_F(CommandLineTests, UsageListsEveryCommand)
    {
        const auto text = usage();
        for (auto const* command : {"upload", "delete", "status", "clear", "encrypt", "decrypt", "--config"})
            EXPECT_THAT(text, ::testing::HasSubstr(command));
    }
}
