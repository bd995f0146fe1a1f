#include "Logging.hpp"

#include <rtc/rtc.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace pairchat::log;

namespace {

::rtc::LogLevel toRtcLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return ::rtc::LogLevel::Verbose;
        case spdlog::level::debug:    return ::rtc::LogLevel::Debug;
        case spdlog::level::info:     return ::rtc::LogLevel::Info;
        case spdlog::level::warn:     return ::rtc::LogLevel::Warning;
        case spdlog::level::err:      return ::rtc::LogLevel::Error;
        case spdlog::level::critical: return ::rtc::LogLevel::Fatal;
        default:                      return ::rtc::LogLevel::None;
    }
}

spdlog::level::level_enum fromRtcLevel(::rtc::LogLevel level) {
    switch (level) {
        case ::rtc::LogLevel::Verbose: return spdlog::level::trace;
        case ::rtc::LogLevel::Debug:   return spdlog::level::debug;
        case ::rtc::LogLevel::Info:    return spdlog::level::info;
        case ::rtc::LogLevel::Warning: return spdlog::level::warn;
        case ::rtc::LogLevel::Error:   return spdlog::level::err;
        case ::rtc::LogLevel::Fatal:   return spdlog::level::critical;
        default:                       return spdlog::level::off;
    }
}

std::shared_ptr<spdlog::logger> colorLogger(const std::string& name) {
    if (auto existing = spdlog::get(name))
        return existing;
    return spdlog::stdout_color_mt(name);
}

}

void pairchat::log::init(const LogConfig& config) {
    auto logger = colorLogger("pairchat");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(config.pattern);
    spdlog::set_level(config.level);

    if (!config.captureTransportLogs)
        return;

    auto transportLogger = colorLogger("rtc");
    transportLogger->set_pattern(config.pattern);
    transportLogger->set_level(config.transportLevel);

    std::weak_ptr<spdlog::logger> weakLogger = transportLogger;
    ::rtc::InitLogger(toRtcLevel(config.transportLevel), [weakLogger](::rtc::LogLevel level, std::string message) {
        if (auto target = weakLogger.lock())
            target->log(fromRtcLevel(level), message);
    });
}
