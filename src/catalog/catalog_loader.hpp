#pragma once

/// @file catalog_loader.hpp
/// @brief Parses catalog result tables in CSV form (TAP csv output or local files).

#include "catalog/catalog_row.hpp"
#include "core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

namespace nearstars::catalog
{
    /// @brief Static utility class for reading CSV result tables.
    ///
    /// Expected format (header row required, column order free, extra columns ignored):
    ///   source_id,ra,dec,parallax
    ///
    /// RA and Dec stay in degrees, parallax in milliarcseconds.
    /// An empty, "null" or "NaN" parallax cell is read as absent.
    /// Rows whose source_id, ra or dec cannot be parsed are skipped with a warning.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Parse a CSV table held in memory.
        /// @param text Full table text including the header row.
        /// @return Rows (possibly none) on success, std::nullopt if the header is
        ///         missing or lacks a required column.
        [[nodiscard]] static std::optional<ResultSet> parse_csv(std::string_view text);

        /// @brief Read and parse a CSV table from disk.
        /// @return Rows on success, std::nullopt if the file cannot be read or parsed.
        [[nodiscard]] static std::optional<ResultSet> load_csv(const std::filesystem::path& path);

    private:
        /// @brief Column positions of source_id, ra, dec, parallax.
        using ColumnMap = std::array<std::size_t, 4>;

        /// @brief Locate the required columns in a header line.
        [[nodiscard]] static std::optional<ColumnMap> map_columns(std::string_view header);

        /// @brief Parse a parallax cell; empty/"null"/"NaN" give an absent value.
        [[nodiscard]] static std::optional<f64> parse_parallax(std::string_view cell);
    };

} // namespace nearstars::catalog
