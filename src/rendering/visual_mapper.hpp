#pragma once

/// @file visual_mapper.hpp
/// @brief Distance -> marker size and colour value, normalized within the sample.

#include "astro/projection.hpp"
#include "core/types.hpp"
#include "rendering/style.hpp"

#include <span>
#include <vector>

namespace nearstars::rendering
{
    /// @brief Closed distance interval spanned by a sample (legend range).
    struct DistanceRange
    {
        f64 min_pc;
        f64 max_pc;
    };

    /// @brief A projected star with its derived visual attributes.
    struct VisualPoint
    {
        astro::ProjectedPoint point;
        f64 normalized;     ///< (d - d_min) / (d_max - d_min), 0 for a degenerate sample
        f64 size;           ///< In [min_size, max_size], larger = nearer
        f64 color;          ///< Colormap input in [0, 1], already inverted (nearer = higher)
    };

    /// @brief Output of map_attributes(): points plus the range they were normalized against.
    struct VisualSample
    {
        std::vector<VisualPoint> points;
        DistanceRange range;
    };

    /// @brief Static utility class deriving size/colour from relative distance.
    ///
    /// size  = (1 - n) · (max_size - min_size) + min_size
    /// color = 1 - n
    ///
    /// When every point has the same distance (including a single-point sample)
    /// n is defined as 0, so such points get max_size and color 1.
    class VisualMapper
    {
    public:
        VisualMapper() = delete;

        /// @brief Map every point. An empty input gives an empty sample with a zero range.
        [[nodiscard]] static VisualSample map_attributes(std::span<const astro::ProjectedPoint> points,
                                                         const PointStyle& style);

        /// @brief Min/max distance of @p points. @p points must be non-empty.
        [[nodiscard]] static DistanceRange distance_range(std::span<const astro::ProjectedPoint> points);

        /// @brief Normalized distance of @p distance_pc within @p range.
        [[nodiscard]] static f64 normalize(f64 distance_pc, const DistanceRange& range);

        /// @brief Marker size for a normalized distance.
        [[nodiscard]] static f64 size_for(f64 normalized, const PointStyle& style);
    };

} // namespace nearstars::rendering
