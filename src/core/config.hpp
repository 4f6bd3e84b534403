#pragma once

/// @file config.hpp
/// @brief Application configuration and its command-line parser.

#include "catalog/gaia_tap_client.hpp"
#include "catalog/query_builder.hpp"
#include "core/types.hpp"
#include "rendering/console_renderer.hpp"
#include "rendering/style.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace nearstars::core
{
    /// @brief Where catalog rows come from.
    enum class CatalogSource : u8
    {
        Gaia,   ///< Gaia archive over TAP
        File,   ///< Local CSV table
    };

    /// @brief Where a single-shot run draws its result.
    enum class OutputKind : u8
    {
        Console,
        Image,
        Window,
    };

    /// @brief Every setting the program reads at startup.
    struct AppConfig
    {
        std::string distance_text;          ///< Empty = prompt on stdin (single-shot)
        std::string unit = "ly";
        bool interactive = false;

        CatalogSource source = CatalogSource::Gaia;
        std::filesystem::path catalog_file;
        catalog::GaiaTapConfig tap;
        catalog::QueryOptions query;

        OutputKind output = OutputKind::Console;
        std::filesystem::path image_path = "nearby_stars.bmp";
        u32 image_width = 1000;
        u32 image_height = 1000;
        std::filesystem::path font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
        rendering::ConsoleConfig console;
        rendering::StyleConfig style;

        spdlog::level::level_enum log_level = spdlog::level::info;
        bool show_help = false;
    };

    /// @brief Static utility class parsing argv into an AppConfig.
    class CommandLine
    {
    public:
        CommandLine() = delete;

        /// @brief Parse arguments (argv[0] is skipped).
        /// @return The configuration, or std::nullopt on an unknown option,
        ///         a missing value or a value out of range (logged).
        [[nodiscard]] static std::optional<AppConfig> parse(int argc, const char* const* argv);

        /// @brief Write the option summary.
        static void print_help(std::ostream& out);
    };

} // namespace nearstars::core
