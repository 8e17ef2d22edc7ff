#pragma once

#include <shared_data/transfer/queue_record.hpp>

#include <string>

namespace Persistence::Test
{
    inline SharedData::QueueRecord makeUploadRecord(std::uint64_t sequence, std::string name)
    {
        const auto now = std::chrono::system_clock::now();
        return SharedData::QueueRecord{
            .id = Ids::generateItemId(),
            .sequence = sequence,
            .createdAt = now,
            .updatedAt = now,
            .body =
                SharedData::UploadRecord{
                    .name = std::move(name),
                    .size = 1024,
                },
        };
    }
}
