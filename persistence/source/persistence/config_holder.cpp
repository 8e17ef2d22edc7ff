#include <persistence/config_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>
#include <roar/filesystem/special_paths.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

namespace Persistence
{
    namespace
    {
        void setupPersistence(std::filesystem::path const& path)
        {
            const auto parentPath = path.parent_path();
            if (!parentPath.empty() && !std::filesystem::exists(parentPath))
                std::filesystem::create_directories(parentPath);
        }
    }

    ConfigHolder::ConfigHolder(std::filesystem::path const& configPath)
        : path_{Roar::resolvePath(configPath)}
        , stateCache_{}
    {}

    std::filesystem::path const& ConfigHolder::path() const
    {
        return path_;
    }

    State& ConfigHolder::stateCache()
    {
        return stateCache_;
    }
    State const& ConfigHolder::stateCache() const
    {
        return stateCache_;
    }

    void ConfigHolder::makeBackup() const
    {
        const auto backupFileName = [this]() {
            const auto now = std::chrono::system_clock::now();
            const auto time = fmt::format("{:%Y-%m-%d_%H-%M-%S}", now);

            return path_.parent_path() / (path_.filename().string() + ".backup_" + time);
        }();

        {
            std::ifstream reader{path_, std::ios_base::binary};
            std::ofstream writer{backupFileName, std::ios_base::binary};

            writer << reader.rdbuf();
        }
        Log::info("ConfigHolder: Copied config file to backup: {}", backupFileName.string());
    }

    bool ConfigHolder::load()
    {
        try
        {
            setupPersistence(path_);

            const auto before = [this]() {
                try
                {
                    std::ifstream reader{path_, std::ios_base::binary};
                    if (!reader.good())
                    {
                        Log::warn("ConfigHolder: Config file does not exist, creating it with defaults.");
                        return nlohmann::json(nullptr);
                    }
                    return nlohmann::json::parse(reader, nullptr, true, true);
                }
                catch (std::exception const& e)
                {
                    Log::error("ConfigHolder: Failed to parse config file: {}", e.what());
                    makeBackup();
                    return nlohmann::json(nullptr);
                }
            }();

            stateCache_ = State{};
            if (before.is_null())
            {
                dataFixer(nlohmann::json::object());
                return true;
            }

            before.get_to(stateCache_);
            dataFixer(before);
            return true;
        }
        catch (std::exception const& e)
        {
            Log::error("ConfigHolder: Failed to load config file: {}", e.what());
            stateCache_ = State::defaults();
            return false;
        }
    }

    void ConfigHolder::dataFixer(nlohmann::json const& before)
    {
        stateCache_.useDefaultsFrom(State::defaults());

        const auto after = nlohmann::json(stateCache_);
        const auto diff = nlohmann::json::diff(before, after);
        if (diff.empty())
            return;

        Log::warn("ConfigHolder: Config file misses some defaults, writing them back to disk: {}", diff.dump());
        const auto result = save();
        if (!result)
            Log::error("ConfigHolder: Could not write defaults back: {}", result.error());
    }

    std::expected<void, std::string> ConfigHolder::save() const
    {
        try
        {
            setupPersistence(path_);
            std::ofstream writer{path_, std::ios_base::binary};
            if (!writer.good())
                return std::unexpected(std::string{"Cannot open config file for writing: "} + path_.string());
            writer << nlohmann::json(stateCache_).dump(4);
            return {};
        }
        catch (std::exception const& e)
        {
            Log::error("ConfigHolder: Failed to save config file: {}", e.what());
            return std::unexpected(std::string{e.what()});
        }
    }
}
