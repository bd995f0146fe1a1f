#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace pairchat::log {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    // Forward libdatachannel's own log lines to the "rtc" logger.
    bool captureTransportLogs = true;
    spdlog::level::level_enum transportLevel = spdlog::level::warn;
};

void init(const LogConfig& config = {});

}
