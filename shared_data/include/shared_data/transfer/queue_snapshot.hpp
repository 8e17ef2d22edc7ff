#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/time_point.hpp>
#include <shared_data/transfer/transfer_status.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    struct ItemView
    {
        Ids::ItemId id{};
        OperationKind kind{OperationKind::Upload};
        std::string name{};
        std::string destinationPath{};
        std::string status{};
        int progress{0};
        std::optional<std::string> remoteKey{std::nullopt};
        std::optional<Ids::FileId> fileId{std::nullopt};
        std::optional<std::string> error{std::nullopt};
        std::optional<std::uint64_t> completedFiles{std::nullopt};
        std::optional<std::uint64_t> totalFiles{std::nullopt};
        std::chrono::system_clock::time_point lastUpdate{};
    };
    BOOST_DESCRIBE_STRUCT(
        ItemView,
        (),
        (id,
         kind,
         name,
         destinationPath,
         status,
         progress,
         remoteKey,
         fileId,
         error,
         completedFiles,
         totalFiles,
         lastUpdate))

    /**
     * @brief Aggregate view of the queue published to observers.
     * While an upload session is active the upload counters come from the session.
     */
    struct QueueSnapshot
    {
        constexpr static std::size_t maxItemViews = 50;
        constexpr static std::size_t maxDeleteViews = 10;

        bool isRunning{false};
        std::size_t activeCount{0};

        std::size_t total{0};
        std::size_t queued{0};
        std::size_t inProgress{0};
        std::size_t completed{0};
        std::size_t failed{0};
        std::size_t cancelled{0};

        std::size_t uploadTotal{0};
        std::size_t uploadQueued{0};
        std::size_t uploadInProgress{0};
        std::size_t uploadCompleted{0};
        std::size_t uploadFailed{0};
        std::size_t uploadCancelled{0};

        std::size_t deleteOperationsCount{0};
        std::size_t deleteInProgress{0};

        std::uint64_t totalSize{0};
        int percentage{0};
        bool sessionActive{false};

        std::vector<ItemView> items{};
        std::vector<ItemView> deleteOperations{};
    };
    BOOST_DESCRIBE_STRUCT(
        QueueSnapshot,
        (),
        (isRunning,
         activeCount,
         total,
         queued,
         inProgress,
         completed,
         failed,
         cancelled,
         uploadTotal,
         uploadQueued,
         uploadInProgress,
         uploadCompleted,
         uploadFailed,
         uploadCancelled,
         deleteOperationsCount,
         deleteInProgress,
         totalSize,
         percentage,
         sessionActive,
         items,
         deleteOperations))

    /**
     * @brief Observer side heuristic: queued items that did not change for longer than threshold.
     * Has no influence on scheduling.
     */
    std::size_t countStalled(
        QueueSnapshot const& snapshot,
        std::chrono::system_clock::time_point now,
        std::chrono::milliseconds threshold = std::chrono::seconds{2});
}
