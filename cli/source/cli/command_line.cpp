#include <cli/command_line.hpp>
#include <persistence/config_holder.hpp>
#include <utility/enum_string_convert.hpp>
#include <log/level.hpp>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <sstream>

namespace po = boost::program_options;

namespace Cli
{
    namespace
    {
        po::options_description makeOptions()
        {
            po::options_description options{"Options"};
            // clang-format off
            options.add_options()
                ("help,h", "print this help")
                ("config,c", po::value<std::string>(), "configuration file")
                ("concurrency,n", po::value<int>(), "parallel transfers")
                ("secret,s", po::value<std::string>(), "encryption secret, also read from VAULTLINE_SECRET")
                ("base-url", po::value<std::string>(), "backend base url")
                ("token", po::value<std::string>(), "backend bearer token")
                ("log-level", po::value<std::string>(), "trace, debug, info, warning, error, critical or off")
                ("log-file", po::value<std::string>(), "rotating log file")
                ("destination,d", po::value<std::string>()->default_value(""), "remote directory for uploads")
                ("output,o", po::value<std::string>(), "target file for encrypt and decrypt")
                ("quiet,q", po::bool_switch(), "no progress output")
            ;
            // clang-format on
            return options;
        }

        po::options_description makeHiddenOptions()
        {
            po::options_description hidden{"Hidden"};
            // clang-format off
            hidden.add_options()
                ("command", po::value<std::string>(), "command")
                ("arguments", po::value<std::vector<std::string>>()->multitoken(), "arguments")
            ;
            // clang-format on
            return hidden;
        }

        std::expected<Command, std::string> commandFromString(std::string const& name)
        {
            if (auto command = Utility::tryEnumFromString<Command>(name, true); command)
                return *command;
            return std::unexpected(fmt::format("Unknown command '{}'.", name));
        }

        std::expected<void, std::string> checkArgumentCount(CommandLine const& commandLine)
        {
            const auto count = commandLine.arguments.size();
            switch (commandLine.command)
            {
                case Command::Upload:
                    if (count == 0)
                        return std::unexpected("upload needs at least one file or directory.");
                    break;
                case Command::Delete:
                    if (count == 0)
                        return std::unexpected("delete needs at least one file id.");
                    break;
                case Command::Encrypt:
                case Command::Decrypt:
                    if (count != 1)
                        return std::unexpected("encrypt and decrypt take exactly one file.");
                    break;
                case Command::Status:
                case Command::Clear:
                    if (count != 0)
                        return std::unexpected("status and clear take no arguments.");
                    break;
                case Command::Help:
                    break;
            }
            return {};
        }
    }

    void CommandLine::applyTo(Persistence::State& state) const
    {
        if (concurrency)
            state.transfer.concurrency = *concurrency;
        if (baseUrl)
            state.backend.baseUrl = *baseUrl;
        if (token)
            state.backend.token = *token;
        if (logLevel)
            state.log.level = Log::levelFromString(*logLevel);
        if (logFile)
            state.log.file = *logFile;
    }

    std::expected<CommandLine, std::string> parseCommandLine(int argc, char const* const* argv)
    {
        auto visible = makeOptions();
        po::options_description all{};
        all.add(visible).add(makeHiddenOptions());

        po::positional_options_description positional{};
        positional.add("command", 1).add("arguments", -1);

        po::variables_map variables{};
        try
        {
            po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), variables);
            po::notify(variables);
        }
        catch (po::error const& exc)
        {
            return std::unexpected(std::string{exc.what()});
        }

        CommandLine commandLine{};
        commandLine.configPath = Persistence::ConfigHolder::defaultConfigPath;

        if (variables.count("help") == 0 && variables.count("command") != 0)
        {
            auto command = commandFromString(variables["command"].as<std::string>());
            if (!command)
                return std::unexpected(std::move(command).error());
            commandLine.command = *command;
        }
        if (variables.count("arguments"))
            commandLine.arguments = variables["arguments"].as<std::vector<std::string>>();

        if (variables.count("config"))
            commandLine.configPath = variables["config"].as<std::string>();
        if (variables.count("concurrency"))
        {
            const auto concurrency = variables["concurrency"].as<int>();
            if (concurrency < 1)
                return std::unexpected("--concurrency must be at least 1.");
            commandLine.concurrency = concurrency;
        }
        if (variables.count("secret"))
            commandLine.secret = variables["secret"].as<std::string>();
        else if (char const* secret = std::getenv("VAULTLINE_SECRET"); secret != nullptr && *secret != '\0')
            commandLine.secret = std::string{secret};
        if (variables.count("base-url"))
            commandLine.baseUrl = variables["base-url"].as<std::string>();
        if (variables.count("token"))
            commandLine.token = variables["token"].as<std::string>();
        if (variables.count("log-level"))
        {
            commandLine.logLevel = variables["log-level"].as<std::string>();
            if (!Log::levelFromString(*commandLine.logLevel))
                return std::unexpected(fmt::format("Unknown log level '{}'.", *commandLine.logLevel));
        }
        if (variables.count("log-file"))
            commandLine.logFile = variables["log-file"].as<std::string>();
        if (variables.count("output"))
            commandLine.output = variables["output"].as<std::string>();
        commandLine.destination = variables["destination"].as<std::string>();
        commandLine.quiet = variables["quiet"].as<bool>();

        if (auto result = checkArgumentCount(commandLine); !result)
            return std::unexpected(std::move(result).error());

        return commandLine;
    }

    std::string usage()
    {
        std::stringstream stream;
        stream << "Usage: vaultline <command> [arguments...] [options]\n\n"
               << "Commands:\n"
               << "  upload <paths...>     upload files and directories (recursive)\n"
               << "  delete <fileIds...>   delete remote files\n"
               << "  status                print the persisted queue\n"
               << "  clear                 remove every item from the queue\n"
               << "  encrypt <file>        encrypt a local file, metadata goes to <output>.meta.json\n"
               << "  decrypt <file>        decrypt a local file using its .meta.json\n\n"
               << makeOptions();
        return stream.str();
    }
}
