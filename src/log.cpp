#include "partfetch/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace partfetch {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
        instance = spdlog::get("partfetch");
        if (!instance) {
            instance = spdlog::stderr_color_mt("partfetch");
        }
        instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
        instance->set_level(spdlog::level::info);
    });
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace partfetch
