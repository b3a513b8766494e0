#pragma once

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace netcall::log {

    /// @brief Name under which the library logger is registered with spdlog.
    inline constexpr const char* kLoggerName = "netcall";

    /**
     * @brief The library logger.
     *
     * Uses the logger registered as "netcall" in the spdlog registry when the
     * application installed one, otherwise creates a stderr logger on first
     * use. Defaults to the `warn` level.
     */
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Adjust verbosity of the library logger.
    void set_level(spdlog::level::level_enum level);

}  // namespace netcall::log
