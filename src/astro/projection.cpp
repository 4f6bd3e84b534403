/// @file projection.cpp
/// @brief Implementation of the distance + tangent-plane projection.

#include "astro/projection.hpp"

#include "core/logger.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace nearstars::astro
{

bool Projection::has_valid_parallax(const catalog::CatalogRow& row)
{
    return row.parallax_mas.has_value()
        && std::isfinite(*row.parallax_mas)
        && *row.parallax_mas > 0.0;
}

f64 Projection::parallax_to_distance_pc(f64 parallax_mas)
{
    // d[pc] = 1 / p[arcsec] = 1000 / p[mas]
    return astro_constants::kMasPerArcsec / parallax_mas;
}

// -----------------------------------------------------------------
// Top-down view of the equatorial frame:
//
//   x = d × cos(dec) × cos(ra)
//   y = d × cos(dec) × sin(ra)
//
// The z = d × sin(dec) component is discarded.
// -----------------------------------------------------------------

Vec2d Projection::to_plane(f64 ra_rad, f64 dec_rad, f64 distance_pc)
{
    const f64 cos_dec = std::cos(dec_rad);
    return Vec2d{
        distance_pc * cos_dec * std::cos(ra_rad),
        distance_pc * cos_dec * std::sin(ra_rad),
    };
}

std::optional<std::vector<ProjectedPoint>> Projection::project(
    std::span<const catalog::CatalogRow> rows)
{
    std::vector<ProjectedPoint> points;
    points.reserve(rows.size());

    std::size_t dropped = 0;

    for (const auto& row : rows)
    {
        if (!has_valid_parallax(row))
        {
            ++dropped;
            continue;
        }

        const f64 distance_pc = parallax_to_distance_pc(*row.parallax_mas);

        // Overflow for denormal parallaxes
        if (!std::isfinite(distance_pc))
        {
            ++dropped;
            continue;
        }

        const Vec2d xy = to_plane(glm::radians(row.ra), glm::radians(row.dec), distance_pc);

        points.push_back(ProjectedPoint{
            .source_id   = row.source_id,
            .distance_pc = distance_pc,
            .x           = xy.x,
            .y           = xy.y,
        });
    }

    if (dropped > 0)
    {
        NST_CORE_DEBUG("Projection: dropped {} rows without a positive parallax", dropped);
    }

    if (points.empty())
    {
        NST_CORE_INFO("Projection: no row of {} has a usable parallax", rows.size());
        return std::nullopt;
    }

    NST_CORE_DEBUG("Projection: projected {} of {} rows", points.size(), rows.size());
    return points;
}

} // namespace nearstars::astro
