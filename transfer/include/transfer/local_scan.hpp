#pragma once

#include <transfer/payload.hpp>
#include <shared_data/transfer/transfer_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Transfer
{
    struct LocalEntry
    {
        enum class FileType
        {
            Regular,
            Directory,
            Other,
        };

        std::filesystem::path path{};
        FileType type{FileType::Other};
        std::uint64_t size{0};
        std::optional<std::size_t> parent{std::nullopt};

        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
    };

    /**
     * @brief Lists one directory, paths are relative to it. Symlinks are not followed.
     */
    std::expected<std::vector<LocalEntry>, SharedData::TransferError>
    scanLocalDirectory(std::filesystem::path const& directory);

    /**
     * @brief Files that share a destination directory. Each group is enqueued as one batch.
     */
    struct UploadGroup
    {
        std::string destinationPath{};
        std::vector<std::shared_ptr<IPayload>> payloads{};
    };

    /**
     * @brief Collects uploads from files and directories. A file lands in destinationPrefix, the files of a
     * directory land below destinationPrefix/<directory name> with their relative directories preserved.
     * Groups keep the order in which the inputs were given.
     */
    std::expected<std::vector<UploadGroup>, SharedData::TransferError>
    collectUploads(std::vector<std::filesystem::path> const& inputs, std::string const& destinationPrefix);

    std::string joinDestination(std::string const& prefix, std::filesystem::path const& relative);
}
