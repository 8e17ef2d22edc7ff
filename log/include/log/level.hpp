#pragma once

#include <utility/algorithm/case_convert.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    BOOST_DEFINE_ENUM_CLASS(Level, Trace, Debug, Info, Warning, Error, Critical, Off)

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return spdlog::level::trace;
            case Level::Debug:
                return spdlog::level::debug;
            case Level::Info:
                return spdlog::level::info;
            case Level::Warning:
                return spdlog::level::warn;
            case Level::Error:
                return spdlog::level::err;
            case Level::Critical:
                return spdlog::level::critical;
            case Level::Off:
                return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        switch (lvl)
        {
            case spdlog::level::trace:
                return Level::Trace;
            case spdlog::level::debug:
                return Level::Debug;
            case spdlog::level::warn:
                return Level::Warning;
            case spdlog::level::err:
                return Level::Error;
            case spdlog::level::critical:
                return Level::Critical;
            case spdlog::level::off:
                return Level::Off;
            default:
                return Level::Info;
        }
    }

    /**
     * @brief Accepts the level names in any case and "warn". Unknown names yield nullopt.
     */
    inline std::optional<Level> levelFromString(std::string_view str)
    {
        if (Utility::Algorithm::equalsIgnoreCase(str, "warn"))
            return Level::Warning;
        return Utility::tryEnumFromString<Level>(str, true);
    }

    /// Lower case name as written to the configuration file.
    inline std::string levelToString(Level lvl)
    {
        return Utility::Algorithm::toLowerCase(Utility::enumToString(lvl));
    }
}
