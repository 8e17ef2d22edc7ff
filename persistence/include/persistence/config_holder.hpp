#pragma once

#include <persistence/state/state.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace Persistence
{
    /**
     * @brief Loads and saves the configuration file. Missing values are filled with defaults and written back.
     */
    class ConfigHolder
    {
      public:
        constexpr static char const* defaultConfigPath = "~/.vaultline/config.json";

        explicit ConfigHolder(std::filesystem::path const& configPath = defaultConfigPath);

        /**
         * @brief Reads the configuration file. An unparsable file is backed up and replaced by defaults.
         *
         * @return false if the state could not be established at all.
         */
        bool load();
        std::expected<void, std::string> save() const;

        State& stateCache();
        State const& stateCache() const;

        std::filesystem::path const& path() const;

      private:
        void dataFixer(nlohmann::json const& before);
        void makeBackup() const;

      private:
        std::filesystem::path path_;
        State stateCache_;
    };
}
