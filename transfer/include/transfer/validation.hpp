#pragma once

#include <transfer/payload.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

namespace Transfer
{
    /**
     * @brief Batch admission limits. A zero disables the corresponding check.
     */
    struct Limits
    {
        std::uint64_t maxFileSize{5ULL * 1024 * 1024 * 1024};
        std::size_t maxFiles{100'000};
        std::uint64_t maxTotalSize{15ULL * 1024 * 1024 * 1024};
        std::size_t maxNameLength{255};
    };

    std::expected<void, SharedData::TransferError> validateName(std::string const& name, Limits const& limits);

    /**
     * @brief Checks the whole batch. Nothing is enqueued unless every entry passes.
     */
    std::expected<void, SharedData::TransferError>
    validateBatch(std::vector<std::shared_ptr<IPayload>> const& payloads, Limits const& limits);
}
