#include "logging/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace VoiceShaper::Log {

std::shared_ptr<spdlog::logger> logger() {
    // Function-local static: initialisation is thread safe
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace VoiceShaper::Log
