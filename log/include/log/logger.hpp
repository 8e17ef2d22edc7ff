#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Log
{
    struct SinkOptions
    {
        Level level{Level::Info};
        bool console{true};
        std::optional<std::filesystem::path> file{std::nullopt};
        std::size_t maxFileSize{5 * 1024 * 1024};
        std::size_t maxFiles{3};
    };

    class Logger
    {
      public:
        Logger()
            : guard_{}
        {}

        /**
         * @brief Replaces the default spdlog logger by one writing to the configured sinks.
         */
        void setup(SinkOptions const& options)
        {
            std::scoped_lock lock{guard_};

            std::vector<spdlog::sink_ptr> sinks{};
            if (options.console)
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            if (options.file)
            {
                if (const auto parent = options.file->parent_path(); !parent.empty())
                {
                    std::error_code ec;
                    std::filesystem::create_directories(parent, ec);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.file->string(), options.maxFileSize, options.maxFiles));
            }

            auto logger = std::make_shared<spdlog::logger>("vaultline", sinks.begin(), sinks.end());
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            logger->set_level(toSpdlogLevel(options.level));
            spdlog::set_default_logger(std::move(logger));
            spdlog::set_level(toSpdlogLevel(options.level));
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!spdlog::should_log(toSpdlogLevel(level)))
                return;
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            spdlog::log(toSpdlogLevel(level), buf);
        }

        void flush()
        {
            if (auto logger = spdlog::default_logger(); logger)
                logger->flush();
        }

      private:
        std::recursive_mutex guard_;
    };
}
