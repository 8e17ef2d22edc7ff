#pragma once

#include <cli/command_line.hpp>
#include <persistence/async_queue_store.hpp>
#include <persistence/config_holder.hpp>
#include <transfer/transfer_engine.hpp>

#include <expected>
#include <memory>
#include <string>

namespace Cli
{
    /**
     * @brief Runs one command. Construct, run, destroy.
     */
    class Application
    {
      public:
        explicit Application(CommandLine commandLine);
        ~Application();

        Application(Application const&) = delete;
        Application& operator=(Application const&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /**
         * @return process exit code.
         */
        int run();

      private:
        bool loadConfiguration();
        void setupLogging() const;
        std::filesystem::path journalPath() const;

        std::expected<void, std::string> createEngine();
        void stopEngine();
        /// Waits for the queue to drain, Ctrl+C cancels everything.
        void waitForEngine();
        void printProgress(SharedData::QueueSnapshot const& snapshot) const;

        int upload();
        int remove();
        int status();
        int clear();
        int encrypt();
        int decrypt();

      private:
        CommandLine commandLine_;
        Persistence::ConfigHolder config_;
        std::shared_ptr<Persistence::AsyncQueueStore> store_;
        std::unique_ptr<Transfer::TransferEngine> engine_;
    };
}
