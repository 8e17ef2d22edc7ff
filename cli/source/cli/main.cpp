#include <cli/application.hpp>
#include <cli/command_line.hpp>

#include <fmt/format.h>

#include <cstdio>

int main(int argc, char** argv)
{
    auto commandLine = Cli::parseCommandLine(argc, argv);
    if (!commandLine)
    {
        fmt::print(stderr, "{}\n\n{}", commandLine.error(), Cli::usage());
        return 2;
    }

    Cli::Application application{std::move(commandLine).value()};
    return application.run();
}
