#include <persistence/state/limit_options.hpp>

namespace Persistence
{
    void LimitOptions::useDefaultsFrom(LimitOptions const& other)
    {
        if (!maxFileSize)
            maxFileSize = other.maxFileSize;
        if (!maxFiles)
            maxFiles = other.maxFiles;
        if (!maxTotalSize)
            maxTotalSize = other.maxTotalSize;
        if (!maxNameLength)
            maxNameLength = other.maxNameLength;
    }
    void to_json(nlohmann::json& j, LimitOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, maxFileSize);
        TO_JSON_OPTIONAL(j, options, maxFiles);
        TO_JSON_OPTIONAL(j, options, maxTotalSize);
        TO_JSON_OPTIONAL(j, options, maxNameLength);
    }
    void from_json(nlohmann::json const& j, LimitOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, maxFileSize);
        FROM_JSON_OPTIONAL(j, options, maxFiles);
        FROM_JSON_OPTIONAL(j, options, maxTotalSize);
        FROM_JSON_OPTIONAL(j, options, maxNameLength);
    }
}
