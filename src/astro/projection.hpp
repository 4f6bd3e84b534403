#pragma once

/// @file projection.hpp
/// @brief Parallax -> distance and equatorial -> observer-centred plane projection.

#include "catalog/catalog_row.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace nearstars::astro
{
    /// @brief A star placed on the observer-centred plane.
    ///
    /// Invariant: x² + y² <= distance_pc² (equality only at dec = 0).
    struct ProjectedPoint
    {
        u64 source_id;
        f64 distance_pc;    ///< Finite, > 0
        f64 x;              ///< d · cos(dec) · cos(ra), parsecs
        f64 y;              ///< d · cos(dec) · sin(ra), parsecs
    };

    /// @brief Static utility class for the distance + projection transform.
    ///
    /// All angles in catalog rows are degrees; parallax is milliarcseconds.
    class Projection
    {
    public:
        Projection() = delete;

        /// @brief Filter, convert and project a catalog result.
        ///
        /// Rows with absent, non-finite or non-positive parallax are dropped.
        /// Surviving rows keep their input order.
        ///
        /// @param rows Raw catalog rows.
        /// @return Projected points, or std::nullopt (empty sample) if no row survives.
        [[nodiscard]] static std::optional<std::vector<ProjectedPoint>> project(
            std::span<const catalog::CatalogRow> rows);

        /// @brief True if the row's parallax gives a finite positive distance.
        [[nodiscard]] static bool has_valid_parallax(const catalog::CatalogRow& row);

        /// @brief Distance in parsecs for a parallax in milliarcseconds (1000 / p).
        [[nodiscard]] static f64 parallax_to_distance_pc(f64 parallax_mas);

        /// @brief Flatten (ra, dec, distance) onto the plane.
        /// @param ra_rad Right ascension (radians).
        /// @param dec_rad Declination (radians).
        /// @param distance_pc Distance (parsecs).
        /// @return (x, y) in parsecs.
        [[nodiscard]] static Vec2d to_plane(f64 ra_rad, f64 dec_rad, f64 distance_pc);
    };

} // namespace nearstars::astro
