#include "netcall/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace netcall::log {

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> instance;

        std::call_once(once, [] {
            instance = spdlog::get(kLoggerName);
            if (!instance) {
                instance = spdlog::stderr_color_mt(kLoggerName);
                instance->set_level(spdlog::level::warn);
            }
        });
        return instance;
    }

    void set_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

}  // namespace netcall::log
