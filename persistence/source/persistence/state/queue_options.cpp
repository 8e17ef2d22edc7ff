#include <persistence/state/queue_options.hpp>

namespace Persistence
{
    void QueueOptions::useDefaultsFrom(QueueOptions const& other)
    {
        if (!autoRemoveCompleted.has_value())
            autoRemoveCompleted = other.autoRemoveCompleted;
        if (!maxRetainedItems.has_value())
            maxRetainedItems = other.maxRetainedItems;
        if (!journalPath.has_value())
            journalPath = other.journalPath;
        if (!compactionFactor.has_value())
            compactionFactor = other.compactionFactor;
    }
    void to_json(nlohmann::json& j, QueueOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, autoRemoveCompleted);
        TO_JSON_OPTIONAL(j, options, maxRetainedItems);
        TO_JSON_OPTIONAL(j, options, journalPath);
        TO_JSON_OPTIONAL(j, options, compactionFactor);
    }
    void from_json(nlohmann::json const& j, QueueOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, autoRemoveCompleted);
        FROM_JSON_OPTIONAL(j, options, maxRetainedItems);
        FROM_JSON_OPTIONAL(j, options, journalPath);
        FROM_JSON_OPTIONAL(j, options, compactionFactor);
    }
}
