#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Log
{
    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{std::make_shared<spdlog::logger>(
                  "sftp-explorer",
                  std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
        {}

        /**
         * @brief Replaces the sinks with a console sink and, if given, a file sink that appends to logFile.
         */
        std::expected<void, std::string> setup(Log::Level level, std::filesystem::path const& logFile)
        {
            std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
            if (!logFile.empty())
            {
                try
                {
                    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), false));
                }
                catch (spdlog::spdlog_ex const& exc)
                {
                    return std::unexpected(std::string{exc.what()});
                }
            }

            auto replacement = std::make_shared<spdlog::logger>("sftp-explorer", sinks.begin(), sinks.end());
            replacement->set_level(toSpdlogLevel(level));
            replacement->flush_on(spdlog::level::warn);

            std::scoped_lock lock{guard_};
            logger_ = std::move(replacement);
            return {};
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            return fromSpdlogLevel(logger_->level());
        }

        void flush()
        {
            std::scoped_lock lock{guard_};
            logger_->flush();
        }

        template <typename... Args>
        void log(Log::Level level, spdlog::format_string_t<Args...> fmt, Args&&... args)
        {
            std::shared_ptr<spdlog::logger> logger;
            {
                std::scoped_lock lock{guard_};
                logger = logger_;
            }
            logger->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
