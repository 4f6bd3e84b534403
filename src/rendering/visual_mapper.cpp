/// @file visual_mapper.cpp
/// @brief Relative distance normalization and attribute derivation.

#include "rendering/visual_mapper.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace nearstars::rendering
{

DistanceRange VisualMapper::distance_range(std::span<const astro::ProjectedPoint> points)
{
    const auto [near_it, far_it] = std::minmax_element(
        points.begin(), points.end(),
        [](const astro::ProjectedPoint& a, const astro::ProjectedPoint& b) {
            return a.distance_pc < b.distance_pc;
        });

    return DistanceRange{
        .min_pc = near_it->distance_pc,
        .max_pc = far_it->distance_pc,
    };
}

f64 VisualMapper::normalize(f64 distance_pc, const DistanceRange& range)
{
    const f64 span = range.max_pc - range.min_pc;
    if (span <= 0.0)
    {
        return 0.0;
    }
    return std::clamp((distance_pc - range.min_pc) / span, 0.0, 1.0);
}

f64 VisualMapper::size_for(f64 normalized, const PointStyle& style)
{
    return (1.0 - normalized) * (style.max_size - style.min_size) + style.min_size;
}

VisualSample VisualMapper::map_attributes(std::span<const astro::ProjectedPoint> points,
                                          const PointStyle& style)
{
    if (points.empty())
    {
        return VisualSample{.points = {}, .range = {.min_pc = 0.0, .max_pc = 0.0}};
    }

    VisualSample sample{
        .points = {},
        .range  = distance_range(points),
    };
    sample.points.reserve(points.size());

    for (const auto& p : points)
    {
        const f64 n = normalize(p.distance_pc, sample.range);
        sample.points.push_back(VisualPoint{
            .point      = p,
            .normalized = n,
            .size       = size_for(n, style),
            .color      = 1.0 - n,
        });
    }

    NST_CORE_DEBUG("VisualMapper: {} points, distance range [{:.3f}, {:.3f}] pc",
                   sample.points.size(), sample.range.min_pc, sample.range.max_pc);

    return sample;
}

} // namespace nearstars::rendering
