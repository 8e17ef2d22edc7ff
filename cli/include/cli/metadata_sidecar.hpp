#pragma once

#include <shared_data/transfer/encryption_metadata.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace Cli
{
    /**
     * @brief The metadata of an encrypted file is kept next to it as <file>.meta.json.
     */
    std::filesystem::path sidecarPathFor(std::filesystem::path const& encryptedFile);

    std::expected<void, std::string>
    writeMetadataSidecar(std::filesystem::path const& encryptedFile, SharedData::EncryptionMetadata const& metadata);

    std::expected<SharedData::EncryptionMetadata, std::string>
    readMetadataSidecar(std::filesystem::path const& encryptedFile);
}
