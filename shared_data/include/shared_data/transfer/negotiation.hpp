#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/transfer/encryption_metadata.hpp>
#include <ids/ids.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief File metadata sent to the backend to obtain an upload destination.
     */
    struct DestinationRequest
    {
        std::string filename{};
        std::string fileType{"application/octet-stream"};
        std::uint64_t fileSize{0};
        std::string relativePath{};
        std::optional<EncryptionMetadata> encryption{std::nullopt};
    };

    /**
     * @brief Short lived write target. Form fields are sent before the file part of a presigned POST.
     */
    struct DestinationDescriptor
    {
        std::string url{};
        std::map<std::string, std::string> fields{};
        std::map<std::string, std::string> headers{};
    };
    BOOST_DESCRIBE_STRUCT(DestinationDescriptor, (), (url, fields, headers))

    struct NegotiatedDestination
    {
        DestinationDescriptor destination{};
        Ids::FileId fileId{};
        std::string remoteKey{};
    };

    struct FailedDeletion
    {
        Ids::FileId fileId{};
        std::string filename{};
        std::string error{};
    };
    BOOST_DESCRIBE_STRUCT(FailedDeletion, (), (fileId, filename, error))

    struct BulkDeleteResult
    {
        std::uint64_t successCount{0};
        std::vector<FailedDeletion> failedItems{};
    };
    BOOST_DESCRIBE_STRUCT(BulkDeleteResult, (), (successCount, failedItems))
}
