/// @file catalog_loader.cpp
/// @brief Implementation of the CSV result-table reader.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"
#include "core/parse.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace nearstars::catalog
{

namespace
{

constexpr std::array<std::string_view, 4> kRequiredColumns{"source_id", "ra", "dec", "parallax"};

// Split one CSV line on commas, stripping optional double quotes around each cell
std::vector<std::string_view> split_cells(std::string_view line)
{
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t comma = line.find(',', start);
        std::string_view cell = core::trim(line.substr(start, comma - start));
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"')
        {
            cell = cell.substr(1, cell.size() - 2);
        }
        cells.push_back(cell);

        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1;
    }
    return cells;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Parse CSV text: header + rows
// -----------------------------------------------------------------

std::optional<ResultSet> CatalogLoader::parse_csv(std::string_view text)
{
    ResultSet rows;

    std::size_t pos = 0;
    std::optional<ColumnMap> columns;
    u32 line_number = 0;
    u32 skipped = 0;

    while (pos < text.size())
    {
        const std::size_t eol = text.find('\n', pos);
        const std::string_view line = core::trim(text.substr(pos, eol - pos));
        pos = (eol == std::string_view::npos) ? text.size() : eol + 1;
        ++line_number;

        if (line.empty())
        {
            continue;
        }

        // First non-empty line is the header
        if (!columns)
        {
            columns = map_columns(line);
            if (!columns)
            {
                return std::nullopt;
            }
            continue;
        }

        const auto cells = split_cells(line);
        const auto& col = *columns;
        const std::size_t needed = std::max({col[0], col[1], col[2], col[3]}) + 1;

        if (cells.size() < needed)
        {
            NST_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto source_id = core::parse_u64(cells[col[0]]);
        const auto ra_deg    = core::parse_f64(cells[col[1]]);
        const auto dec_deg   = core::parse_f64(cells[col[2]]);

        if (!source_id || !ra_deg || !dec_deg)
        {
            NST_CORE_WARN("CatalogLoader: Failed to parse values on line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        rows.push_back(CatalogRow{
            .source_id    = *source_id,
            .ra           = *ra_deg,
            .dec          = *dec_deg,
            .parallax_mas = parse_parallax(cells[col[3]]),
        });
    }

    if (!columns)
    {
        NST_CORE_ERROR("CatalogLoader: Table has no header row");
        return std::nullopt;
    }

    if (skipped > 0)
    {
        NST_CORE_WARN("CatalogLoader: Skipped {} malformed lines", skipped);
    }

    NST_CORE_DEBUG("CatalogLoader: Parsed {} rows", rows.size());

    return rows;
}

// -----------------------------------------------------------------
// Load CSV from disk
// -----------------------------------------------------------------

std::optional<ResultSet> CatalogLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        NST_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto rows = parse_csv(buffer.str());
    if (rows)
    {
        NST_CORE_INFO("CatalogLoader: Loaded {} rows from {}", rows->size(), path.string());
    }
    return rows;
}

// -----------------------------------------------------------------
// Header -> column indices
// -----------------------------------------------------------------

std::optional<CatalogLoader::ColumnMap> CatalogLoader::map_columns(std::string_view header)
{
    const auto names = split_cells(header);

    ColumnMap map{};
    for (std::size_t required = 0; required < kRequiredColumns.size(); ++required)
    {
        bool found = false;
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            if (core::to_lower(names[i]) == kRequiredColumns[required])
            {
                map[required] = i;
                found = true;
                break;
            }
        }

        if (!found)
        {
            NST_CORE_ERROR("CatalogLoader: Header lacks column '{}': {}",
                           kRequiredColumns[required], header);
            return std::nullopt;
        }
    }
    return map;
}

std::optional<f64> CatalogLoader::parse_parallax(std::string_view cell)
{
    const std::string lowered = core::to_lower(cell);
    if (lowered.empty() || lowered == "null" || lowered == "nan" || lowered == "--")
    {
        return std::nullopt;
    }

    const auto value = core::parse_f64(cell);
    if (!value || !std::isfinite(*value))
    {
        return std::nullopt;
    }
    return value;
}

} // namespace nearstars::catalog
