#pragma once
#include "name_space.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
namespace NSNAME
{
inline constexpr auto LOGGER_NAME = "lldpwatch";

inline std::shared_ptr<spdlog::logger>& logger()
{
    static std::shared_ptr<spdlog::logger> instance =
        std::make_shared<spdlog::logger>(
            LOGGER_NAME, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return instance;
}

// Not synchronised with running watchers, configure before start().
inline void setLogSink(spdlog::sink_ptr sink)
{
    auto level = logger()->level();
    logger() = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger()->set_level(level);
}

inline void setLogLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}
} // namespace NSNAME

#define LOG_ERROR(...) NSNAME::logger()->error(__VA_ARGS__)
#define LOG_WARNING(...) NSNAME::logger()->warn(__VA_ARGS__)
#define LOG_INFO(...) NSNAME::logger()->info(__VA_ARGS__)
#define LOG_DEBUG(...) NSNAME::logger()->debug(__VA_ARGS__)
