#include <transfer/local_scan.hpp>
#include <utility/directory_traversal.hpp>
#include <log/log.hpp>

#include <functional>
#include <map>

namespace Transfer
{
    namespace
    {
        SharedData::TransferError unavailable(std::filesystem::path const& path, std::string const& reason)
        {
            return SharedData::TransferError{
                .type = SharedData::TransferErrorType::PayloadUnavailable,
                .message = fmt::format("{}: {}", path.string(), reason),
            };
        }

        using Scanner = std::function<std::expected<std::vector<LocalEntry>, SharedData::TransferError>(
            std::filesystem::path const&)>;
        using LocalWalker = Utility::DirectoryWalker<LocalEntry, SharedData::TransferError, Scanner>;
    }

    std::expected<std::vector<LocalEntry>, SharedData::TransferError>
    scanLocalDirectory(std::filesystem::path const& directory)
    {
        std::error_code ec;
        std::filesystem::directory_iterator iter{directory, ec};
        if (ec)
            return std::unexpected(unavailable(directory, ec.message()));

        std::vector<LocalEntry> entries{};
        for (; iter != std::filesystem::directory_iterator{}; iter.increment(ec))
        {
            auto const& dirEntry = *iter;
            LocalEntry entry{.path = dirEntry.path().filename()};
            if (dirEntry.is_symlink(ec))
                entry.type = LocalEntry::FileType::Other;
            else if (dirEntry.is_directory(ec))
                entry.type = LocalEntry::FileType::Directory;
            else if (dirEntry.is_regular_file(ec))
            {
                entry.type = LocalEntry::FileType::Regular;
                entry.size = dirEntry.file_size(ec);
            }
            if (ec)
                return std::unexpected(unavailable(dirEntry.path(), ec.message()));
            entries.push_back(std::move(entry));
        }
        if (ec)
            return std::unexpected(unavailable(directory, ec.message()));
        return entries;
    }

    std::string joinDestination(std::string const& prefix, std::filesystem::path const& relative)
    {
        auto relativeString = relative.generic_string();
        if (relativeString == ".")
            relativeString.clear();
        if (prefix.empty())
            return relativeString;
        if (relativeString.empty())
            return prefix;
        if (prefix.back() == '/')
            return prefix + relativeString;
        return prefix + "/" + relativeString;
    }

    std::expected<std::vector<UploadGroup>, SharedData::TransferError>
    collectUploads(std::vector<std::filesystem::path> const& inputs, std::string const& destinationPrefix)
    {
        std::vector<UploadGroup> groups{};
        auto groupFor = [&groups](std::string const& destination) -> UploadGroup& {
            for (auto& group : groups)
            {
                if (group.destinationPath == destination)
                    return group;
            }
            groups.push_back(UploadGroup{.destinationPath = destination});
            return groups.back();
        };

        for (auto const& input : inputs)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(input, ec);
            if (ec)
                return std::unexpected(unavailable(input, ec.message()));

            if (std::filesystem::is_regular_file(status))
            {
                groupFor(destinationPrefix).payloads.push_back(std::make_shared<FilePayload>(input));
                continue;
            }
            if (!std::filesystem::is_directory(status))
                return std::unexpected(unavailable(input, "not a regular file or directory"));

            LocalWalker walker{input, Scanner{&scanLocalDirectory}};
            if (auto result = walker.walkAll(); !result)
                return std::unexpected(std::move(result).error());

            Log::debug(
                "Collected {} files ({} bytes) below '{}'.", walker.fileCount(), walker.totalBytes(), input.string());

            // files of one directory keep the order of the scan, directories are sorted by name
            std::map<std::string, std::vector<std::shared_ptr<IPayload>>> byDirectory{};
            for (auto const& entry : walker.entries())
            {
                if (!entry.isRegularFile())
                    continue;
                const auto relative = walker.relativePath(entry).parent_path();
                byDirectory[joinDestination(destinationPrefix, relative)].push_back(
                    std::make_shared<FilePayload>(walker.fullPath(entry)));
            }
            for (auto& [destination, payloads] : byDirectory)
            {
                auto& group = groupFor(destination);
                group.payloads.insert(
                    group.payloads.end(),
                    std::make_move_iterator(payloads.begin()),
                    std::make_move_iterator(payloads.end()));
            }
        }
        return groups;
    }
}
