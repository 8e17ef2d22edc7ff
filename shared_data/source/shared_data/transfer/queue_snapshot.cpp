#include <shared_data/transfer/queue_snapshot.hpp>

#include <algorithm>

namespace SharedData
{
    std::size_t countStalled(
        QueueSnapshot const& snapshot,
        std::chrono::system_clock::time_point now,
        std::chrono::milliseconds threshold)
    {
        const auto queuedName = Utility::enumToString(UploadStatus::Queued);
        return static_cast<std::size_t>(std::count_if(
            snapshot.items.begin(), snapshot.items.end(), [&queuedName, now, threshold](ItemView const& view) {
                return view.status == queuedName && now - view.lastUpdate > threshold;
            }));
    }
}
