#include <cli/metadata_sidecar.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace Cli
{
    std::filesystem::path sidecarPathFor(std::filesystem::path const& encryptedFile)
    {
        auto path = encryptedFile;
        path += ".meta.json";
        return path;
    }

    std::expected<void, std::string>
    writeMetadataSidecar(std::filesystem::path const& encryptedFile, SharedData::EncryptionMetadata const& metadata)
    {
        const auto path = sidecarPathFor(encryptedFile);
        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
            return std::unexpected(fmt::format("Could not open '{}' for writing.", path.string()));

        nlohmann::json j;
        SharedData::to_json(j, metadata);
        writer << j.dump(4);
        if (!writer.good())
            return std::unexpected(fmt::format("Could not write '{}'.", path.string()));
        return {};
    }

    std::expected<SharedData::EncryptionMetadata, std::string>
    readMetadataSidecar(std::filesystem::path const& encryptedFile)
    {
        const auto path = sidecarPathFor(encryptedFile);
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(fmt::format("Metadata file '{}' is missing.", path.string()));

        try
        {
            const auto j = nlohmann::json::parse(reader);
            SharedData::EncryptionMetadata metadata{};
            SharedData::from_json(j, metadata);
            return metadata;
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected(fmt::format("Metadata file '{}' is invalid: {}", path.string(), exc.what()));
        }
        catch (std::runtime_error const& exc)
        {
            return std::unexpected(fmt::format("Metadata file '{}' is incomplete: {}", path.string(), exc.what()));
        }
    }
}
