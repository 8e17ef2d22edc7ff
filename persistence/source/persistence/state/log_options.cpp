#include <persistence/state/log_options.hpp>

namespace Persistence
{
    void LogOptions::useDefaultsFrom(LogOptions const& other)
    {
        if (!level)
            level = other.level;
        if (!file)
            file = other.file;
    }
    void to_json(nlohmann::json& j, LogOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.level)
            j["level"] = Log::levelToString(*options.level);
        TO_JSON_OPTIONAL(j, options, file);
    }
    void from_json(nlohmann::json const& j, LogOptions& options)
    {
        // unknown names fall back to the default level
        if (j.contains("level") && j.at("level").is_string())
            options.level = Log::levelFromString(j.at("level").get<std::string>());
        else
            options.level = std::nullopt;
        FROM_JSON_OPTIONAL(j, options, file);
    }
}
