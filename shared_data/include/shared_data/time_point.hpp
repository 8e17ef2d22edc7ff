#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>

namespace SharedData
{
    inline std::int64_t toEpochMilliseconds(std::chrono::system_clock::time_point const& tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
    inline std::chrono::system_clock::time_point fromEpochMilliseconds(std::int64_t milliseconds)
    {
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds{milliseconds})};
    }

    inline void to_json(nlohmann::json& j, std::chrono::time_point<std::chrono::system_clock> const& tp)
    {
        j = toEpochMilliseconds(tp);
    }
    inline void from_json(nlohmann::json const& j, std::chrono::time_point<std::chrono::system_clock>& tp)
    {
        tp = fromEpochMilliseconds(j.get<std::int64_t>());
    }
}

// Inject into STD for ADL:
namespace std::chrono
{
    inline void to_json(nlohmann::json& j, time_point<system_clock> const& tp)
    {
        SharedData::to_json(j, tp);
    }
    inline void from_json(nlohmann::json const& j, time_point<system_clock>& tp)
    {
        SharedData::from_json(j, tp);
    }
}
