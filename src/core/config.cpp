/// @file config.cpp
/// @brief Command-line parsing.

#include "core/config.hpp"

#include "astro/units.hpp"
#include "core/logger.hpp"
#include "core/parse.hpp"
#include "rendering/colormap.hpp"

#include <cmath>
#include <limits>
#include <string_view>

namespace nearstars::core
{

namespace
{

std::optional<u32> parse_positive_u32(std::string_view text)
{
    const auto value = parse_u64(trim(text));
    if (!value || *value == 0 || *value > std::numeric_limits<u32>::max())
    {
        return std::nullopt;
    }
    return static_cast<u32>(*value);
}

std::optional<f64> parse_non_negative(std::string_view text)
{
    const auto value = parse_f64(trim(text));
    if (!value || !std::isfinite(*value) || *value < 0.0)
    {
        return std::nullopt;
    }
    return value;
}

// "1200x900"
bool parse_size(std::string_view text, u32& width, u32& height)
{
    const std::size_t x = text.find_first_of("xX");
    if (x == std::string_view::npos)
    {
        return false;
    }
    const auto w = parse_positive_u32(text.substr(0, x));
    const auto h = parse_positive_u32(text.substr(x + 1));
    if (!w || !h)
    {
        return false;
    }
    width = *w;
    height = *h;
    return true;
}

} // anonymous namespace

std::optional<AppConfig> CommandLine::parse(int argc, const char* const* argv)
{
    AppConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        // Flags without a value
        if (arg == "-h" || arg == "--help")
        {
            config.show_help = true;
            continue;
        }
        if (arg == "-i" || arg == "--interactive")
        {
            config.interactive = true;
            continue;
        }
        if (arg == "--color")
        {
            config.console.ansi_color = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            NST_CORE_ERROR("Missing value for {}", arg);
            return std::nullopt;
        }
        const std::string_view value = argv[++i];
        bool ok = true;

        if (arg == "-d" || arg == "--distance")
        {
            config.distance_text = std::string(value);
        }
        else if (arg == "-u" || arg == "--unit")
        {
            ok = astro::Units::parse_unit(value).has_value();
            config.unit = std::string(value);
        }
        else if (arg == "--source")
        {
            if (value == "gaia")      config.source = CatalogSource::Gaia;
            else if (value == "file") config.source = CatalogSource::File;
            else                      ok = false;
        }
        else if (arg == "--catalog-file")
        {
            config.catalog_file = value;
            config.source = CatalogSource::File;
        }
        else if (arg == "--table")
        {
            ok = !trim(value).empty();
            config.query.table = std::string(trim(value));
        }
        else if (arg == "--row-limit")
        {
            const auto limit = parse_u64(trim(value));
            ok = limit.has_value() && *limit <= std::numeric_limits<u32>::max();
            config.query.row_limit = ok ? static_cast<u32>(*limit) : 0;
        }
        else if (arg == "--tap-url")
        {
            config.tap.url = std::string(value);
        }
        else if (arg == "--timeout")
        {
            const auto timeout = parse_u64(trim(value));
            ok = timeout.has_value() && *timeout <= 86'400;
            config.tap.timeout_sec = ok ? static_cast<long>(*timeout) : 0;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (value == "console")     config.output = OutputKind::Console;
            else if (value == "image")  config.output = OutputKind::Image;
            else if (value == "window") config.output = OutputKind::Window;
            else                        ok = false;
        }
        else if (arg == "--image")
        {
            config.image_path = value;
            config.output = OutputKind::Image;
        }
        else if (arg == "--image-size")
        {
            ok = parse_size(value, config.image_width, config.image_height);
        }
        else if (arg == "--font")
        {
            config.font_path = value;
        }
        else if (arg == "--console-size")
        {
            ok = parse_size(value, config.console.width, config.console.height);
        }
        else if (arg == "--min-size")
        {
            const auto size = parse_non_negative(value);
            ok = size.has_value();
            config.style.points.min_size = size.value_or(0.0);
        }
        else if (arg == "--max-size")
        {
            const auto size = parse_non_negative(value);
            ok = size.has_value();
            config.style.points.max_size = size.value_or(0.0);
        }
        else if (arg == "--colormap")
        {
            const auto kind = rendering::Colormap::parse(value);
            ok = kind.has_value();
            config.style.colormap = kind.value_or(rendering::ColormapKind::Coolwarm);
        }
        else if (arg == "--log-level")
        {
            config.log_level = spdlog::level::from_str(std::string(value));
            ok = config.log_level != spdlog::level::off || value == "off";
        }
        else
        {
            NST_CORE_ERROR("Unknown option {}", arg);
            return std::nullopt;
        }

        if (!ok)
        {
            NST_CORE_ERROR("Invalid value '{}' for {}", value, arg);
            return std::nullopt;
        }
    }

    if (config.style.points.min_size > config.style.points.max_size)
    {
        NST_CORE_ERROR("--min-size ({}) exceeds --max-size ({})",
                       config.style.points.min_size, config.style.points.max_size);
        return std::nullopt;
    }

    if (config.source == CatalogSource::File && config.catalog_file.empty())
    {
        NST_CORE_ERROR("--source file requires --catalog-file");
        return std::nullopt;
    }

    return config;
}

void CommandLine::print_help(std::ostream& out)
{
    out << "Usage: nearstars [options]\n"
           "\n"
           "Plot the stars within a distance of the Sun, top-down, sized and\n"
           "coloured by distance.\n"
           "\n"
           "  -d, --distance <value>     Maximum distance (prompted for if omitted)\n"
           "  -u, --unit <unit>          ly (default), pc, kpc, Mpc, au, km, m\n"
           "  -i, --interactive          Open a window; type a distance and press Enter\n"
           "\n"
           "  --source <gaia|file>       Catalog source (default gaia)\n"
           "  --catalog-file <path>      CSV table with source_id,ra,dec,parallax\n"
           "  --table <name>             TAP table (default gaiadr2.gaia_source)\n"
           "  --row-limit <n>            Add TOP n to the query (0 = none)\n"
           "  --tap-url <url>            TAP sync endpoint\n"
           "  --timeout <seconds>        HTTP timeout (default 120, 0 = none)\n"
           "\n"
           "  -o, --output <kind>        console (default), image, window\n"
           "  --image <path>             BMP output file (implies --output image)\n"
           "  --image-size <WxH>         Image size in pixels (default 1000x1000)\n"
           "  --font <path>              TrueType font for image/window text (\"\" = none)\n"
           "  --console-size <WxH>       Console plot size in characters (default 79x35)\n"
           "  --color                    ANSI colours in console output\n"
           "  --min-size <s>             Marker size of the farthest star (default 10)\n"
           "  --max-size <s>             Marker size of the nearest star (default 100)\n"
           "  --colormap <name>          coolwarm (default), viridis, gray\n"
           "\n"
           "  --log-level <level>        trace, debug, info (default), warn, err, critical, off\n"
           "  -h, --help                 Show this help\n";
}

} // namespace nearstars::core
