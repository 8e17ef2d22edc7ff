#include <persistence/state/backend_options.hpp>

namespace Persistence
{
    void BackendOptions::useDefaultsFrom(BackendOptions const& other)
    {
        if (!baseUrl)
            baseUrl = other.baseUrl;
        if (!token)
            token = other.token;
        if (!timeoutSeconds)
            timeoutSeconds = other.timeoutSeconds;
        if (!negotiatePath)
            negotiatePath = other.negotiatePath;
        if (!commitPath)
            commitPath = other.commitPath;
        if (!deletePath)
            deletePath = other.deletePath;
    }
    void to_json(nlohmann::json& j, BackendOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, baseUrl);
        TO_JSON_OPTIONAL(j, options, token);
        TO_JSON_OPTIONAL(j, options, timeoutSeconds);
        TO_JSON_OPTIONAL(j, options, negotiatePath);
        TO_JSON_OPTIONAL(j, options, commitPath);
        TO_JSON_OPTIONAL(j, options, deletePath);
    }
    void from_json(nlohmann::json const& j, BackendOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, baseUrl);
        FROM_JSON_OPTIONAL(j, options, token);
        FROM_JSON_OPTIONAL(j, options, timeoutSeconds);
        FROM_JSON_OPTIONAL(j, options, negotiatePath);
        FROM_JSON_OPTIONAL(j, options, commitPath);
        FROM_JSON_OPTIONAL(j, options, deletePath);
    }
}
