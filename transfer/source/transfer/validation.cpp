#include <transfer/validation.hpp>
#include <utility/format_bytes.hpp>

#include <fmt/format.h>

namespace Transfer
{
    namespace
    {
        std::unexpected<SharedData::TransferError> invalid(std::string message)
        {
            return std::unexpected(SharedData::TransferError{
                .type = SharedData::TransferErrorType::Validation,
                .message = std::move(message),
            });
        }
    }

    std::expected<void, SharedData::TransferError> validateName(std::string const& name, Limits const& limits)
    {
        if (name.empty())
            return invalid("File name is empty");
        if (limits.maxNameLength != 0 && name.size() > limits.maxNameLength)
            return invalid(fmt::format("File name '{}...' exceeds {} characters", name.substr(0, 32), limits.maxNameLength));
        return {};
    }

    std::expected<void, SharedData::TransferError>
    validateBatch(std::vector<std::shared_ptr<IPayload>> const& payloads, Limits const& limits)
    {
        if (limits.maxFiles != 0 && payloads.size() > limits.maxFiles)
            return invalid(fmt::format("Batch holds {} files, at most {} are allowed", payloads.size(), limits.maxFiles));

        std::uint64_t totalSize = 0;
        for (auto const& payload : payloads)
        {
            if (!payload)
                return invalid("Batch contains an empty payload");

            const auto name = payload->name();
            if (auto valid = validateName(name, limits); !valid)
                return valid;

            const auto size = payload->size();
            if (limits.maxFileSize != 0 && size > limits.maxFileSize)
                return invalid(fmt::format(
                    "'{}' is {}, the limit is {}",
                    name,
                    Utility::formatBytes(size),
                    Utility::formatBytes(limits.maxFileSize)));
            totalSize += size;
        }

        if (limits.maxTotalSize != 0 && totalSize > limits.maxTotalSize)
            return invalid(fmt::format(
                "Batch is {}, the limit is {}",
                Utility::formatBytes(totalSize),
                Utility::formatBytes(limits.maxTotalSize)));
        return {};
    }
}
