#include "pairlink/core/logger.hpp"

#include <mutex>

namespace pairlink::logging {

std::shared_ptr<spdlog::logger> Logger::core_logger_;

namespace {
    std::once_flag g_init_flag;

    void CreateLogger(std::shared_ptr<spdlog::logger>& slot) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        slot = std::make_shared<spdlog::logger>("pairlink", console_sink);
        slot->set_level(spdlog::level::info);
        slot->flush_on(spdlog::level::warn);
    }
}

void Logger::Init(const spdlog::level::level_enum level) {
    std::call_once(g_init_flag, [] { CreateLogger(core_logger_); });
    core_logger_->set_level(level);
}

void Logger::SetLevel(const spdlog::level::level_enum level) {
    Get()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    std::call_once(g_init_flag, [] { CreateLogger(core_logger_); });
    return core_logger_;
}

std::string ShortTag(const std::span<const uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string tag;
    for (size_t i = 0; i < bytes.size() && i < 2; ++i) {
        const uint8_t byte = bytes[i];
        tag.push_back(hex_chars[(byte >> 4) & 0x0F]);
        tag.push_back(hex_chars[byte & 0x0F]);
    }
    return tag;
}

}
