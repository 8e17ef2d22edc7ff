#pragma once

#include <persistence/state/state.hpp>
#include <utility/describe.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Cli
{
    BOOST_DEFINE_ENUM_CLASS(Command, Help, Upload, Delete, Status, Clear, Encrypt, Decrypt)

    struct CommandLine
    {
        Command command{Command::Help};
        std::vector<std::string> arguments{};

        std::filesystem::path configPath{};
        std::optional<int> concurrency{std::nullopt};
        std::optional<std::string> secret{std::nullopt};
        std::optional<std::string> baseUrl{std::nullopt};
        std::optional<std::string> token{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::string> logFile{std::nullopt};

        /// Remote directory uploads land in.
        std::string destination{};
        /// Target file of encrypt and decrypt.
        std::optional<std::filesystem::path> output{std::nullopt};
        bool quiet{false};

        /**
         * @brief Flags take precedence over the configuration file.
         */
        void applyTo(Persistence::State& state) const;
    };

    std::expected<CommandLine, std::string> parseCommandLine(int argc, char const* const* argv);

    std::string usage();
}
