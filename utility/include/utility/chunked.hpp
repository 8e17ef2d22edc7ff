#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Utility
{
    /**
     * @brief Splits a span into consecutive views of at most chunkSize elements, preserving order.
     * A chunkSize of 0 yields a single chunk containing everything.
     */
    template <typename T>
    std::vector<std::span<T>> chunked(std::span<T> elements, std::size_t chunkSize)
    {
        std::vector<std::span<T>> chunks{};
        if (elements.empty())
            return chunks;
        if (chunkSize == 0)
            chunkSize = elements.size();

        chunks.reserve((elements.size() + chunkSize - 1) / chunkSize);
        for (std::size_t offset = 0; offset < elements.size(); offset += chunkSize)
            chunks.push_back(elements.subspan(offset, std::min(chunkSize, elements.size() - offset)));
        return chunks;
    }
}
