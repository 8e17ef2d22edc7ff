#pragma once

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <string>

namespace Utility
{
    enum class OrderOfMagnitude
    {
        None = 0,
        Kilo,
        Mega,
        Giga,
        Tera
    };

    inline OrderOfMagnitude determineOrderOfMagnitude(std::uint64_t value)
    {
        int magnitude = 0;
        while (value >= 1024 && magnitude < static_cast<int>(OrderOfMagnitude::Tera))
        {
            value /= 1024;
            ++magnitude;
        }
        return static_cast<OrderOfMagnitude>(magnitude);
    }

    /**
     * @brief Binary units with two decimals, plain bytes without.
     */
    inline std::string formatBytes(std::uint64_t value, OrderOfMagnitude magnitude)
    {
        constexpr std::array<char const*, 5> units{"B", "KB", "MB", "GB", "TB"};
        const auto index = static_cast<std::size_t>(magnitude);
        if (index == 0)
            return fmt::format("{} B", value);

        double scaled = static_cast<double>(value);
        for (std::size_t i = 0; i < index; ++i)
            scaled /= 1024.0;
        return fmt::format("{:.2f} {}", scaled, units[index]);
    }

    inline std::string formatBytes(std::uint64_t value)
    {
        return formatBytes(value, determineOrderOfMagnitude(value));
    }
}
