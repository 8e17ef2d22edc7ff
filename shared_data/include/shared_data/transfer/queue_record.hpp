#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/time_point.hpp>
#include <shared_data/transfer/transfer_status.hpp>
#include <shared_data/transfer/transfer_error.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SharedData
{
    struct UploadRecord
    {
        std::string name{};
        std::string destinationPath{};
        std::uint64_t size{0};
        std::string mimeType{"application/octet-stream"};
        UploadStatus status{UploadStatus::Queued};
        int progress{0};
        std::optional<std::string> remoteKey{std::nullopt};
        std::optional<Ids::FileId> fileId{std::nullopt};
        std::optional<Ids::BatchId> batchId{std::nullopt};
        bool encrypted{false};
    };
    BOOST_DESCRIBE_STRUCT(
        UploadRecord,
        (),
        (name, destinationPath, size, mimeType, status, progress, remoteKey, fileId, batchId, encrypted))

    struct DeleteRecord
    {
        std::vector<Ids::FileId> targets{};
        std::uint64_t totalFiles{0};
        std::uint64_t completedFiles{0};
        std::uint64_t failedFiles{0};
        DeleteStatus status{DeleteStatus::Queued};
        int progress{0};
    };
    BOOST_DESCRIBE_STRUCT(DeleteRecord, (), (targets, totalFiles, completedFiles, failedFiles, status, progress))

    /**
     * @brief Durable form of one queue entry. Either an upload or a bulk delete operation.
     */
    struct QueueRecord
    {
        Ids::ItemId id{};
        std::uint64_t sequence{0};
        std::chrono::system_clock::time_point createdAt{};
        std::chrono::system_clock::time_point updatedAt{};
        std::optional<TransferError> error{std::nullopt};
        std::variant<UploadRecord, DeleteRecord> body{};

        OperationKind kind() const
        {
            return std::holds_alternative<UploadRecord>(body) ? OperationKind::Upload : OperationKind::Delete;
        }

        UploadRecord* upload()
        {
            return std::get_if<UploadRecord>(&body);
        }
        UploadRecord const* upload() const
        {
            return std::get_if<UploadRecord>(&body);
        }
        DeleteRecord* deletion()
        {
            return std::get_if<DeleteRecord>(&body);
        }
        DeleteRecord const* deletion() const
        {
            return std::get_if<DeleteRecord>(&body);
        }

        bool isTerminal() const;
        bool isQueued() const;
        bool isActive() const;
    };

    void to_json(nlohmann::json& j, QueueRecord const& record);
    void from_json(nlohmann::json const& j, QueueRecord& record);
}
