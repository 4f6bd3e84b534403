/// @file logger.cpp
/// @brief Logger implementation: NEARSTARS + APP loggers over shared stderr and file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

namespace nearstars::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";
constexpr const char* kLogFile = "nearstars.log";
constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxFiles = 3;

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::init()
{
    std::vector<spdlog::sink_ptr> sinks;

    // stderr, not stdout: the console renderer owns stdout
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            kLogFile, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }
    catch (const spdlog::spdlog_ex& e)
    {
        std::cerr << "Logging to console only, cannot open " << kLogFile << ": " << e.what() << '\n';
    }

    s_core_logger = make_logger("NEARSTARS", sinks);
    s_app_logger = make_logger("APP", sinks);
}

void Logger::set_level(spdlog::level::level_enum level)
{
    s_core_logger->set_level(level);
    s_app_logger->set_level(level);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace nearstars::core
