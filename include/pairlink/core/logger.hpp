#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <span>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pairlink::logging {

class Logger {
public:
    /// Installs the `pairlink` logger with a colour stdout sink. Safe to call
    /// more than once; later calls only change the level.
    static void Init(spdlog::level::level_enum level = spdlog::level::info);

    static void SetLevel(spdlog::level::level_enum level);

    /// Returns the core logger, creating it with default settings on first use.
    static std::shared_ptr<spdlog::logger>& Get();

private:
    static std::shared_ptr<spdlog::logger> core_logger_;
};

/// Short, non-secret tag for a byte string: the first four hex characters.
[[nodiscard]] std::string ShortTag(std::span<const uint8_t> bytes);

#define PAIRLINK_LOG_TRACE(...) ::pairlink::logging::Logger::Get()->trace(__VA_ARGS__)
#define PAIRLINK_LOG_DEBUG(...) ::pairlink::logging::Logger::Get()->debug(__VA_ARGS__)
#define PAIRLINK_LOG_INFO(...)  ::pairlink::logging::Logger::Get()->info(__VA_ARGS__)
#define PAIRLINK_LOG_WARN(...)  ::pairlink::logging::Logger::Get()->warn(__VA_ARGS__)
#define PAIRLINK_LOG_ERROR(...) ::pairlink::logging::Logger::Get()->error(__VA_ARGS__)

}
