#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace nearstars::core
{
    /// @brief Centralized logging facility for NearStars.
    ///
    /// Provides two separate loggers:
    /// - **NEARSTARS** (core): catalog transport, projection, renderer internals
    /// - **APP**: pipeline progress and user-facing messages
    ///
    /// Both write to colored stderr (stdout is left to the console plot) and
    /// a rotating nearstars.log, falling back to stderr only if the file
    /// cannot be opened.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any NST_ macros are used.
        static void init();

        /// @brief Set the threshold level of both loggers.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("NEARSTARS").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace nearstars::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define NST_CORE_TRACE(...)    ::nearstars::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define NST_CORE_DEBUG(...)    ::nearstars::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define NST_CORE_INFO(...)     ::nearstars::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define NST_CORE_WARN(...)     ::nearstars::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define NST_CORE_ERROR(...)    ::nearstars::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define NST_CORE_CRITICAL(...) ::nearstars::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define NST_TRACE(...)         ::nearstars::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define NST_DEBUG(...)         ::nearstars::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define NST_INFO(...)          ::nearstars::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define NST_WARN(...)          ::nearstars::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define NST_ERROR(...)         ::nearstars::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define NST_CRITICAL(...)      ::nearstars::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
