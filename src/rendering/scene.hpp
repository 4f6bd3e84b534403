#pragma once

/// @file scene.hpp
/// @brief Complete, renderer-independent description of one plot.

#include "astro/units.hpp"
#include "core/types.hpp"
#include "rendering/style.hpp"
#include "rendering/visual_mapper.hpp"

#include <string>
#include <vector>

namespace nearstars::rendering
{
    /// @brief Everything a renderer needs to draw one result.
    ///
    /// Both axes span [-axis_bound, +axis_bound] parsecs. The observer sits at
    /// the origin and is not part of @c stars. @c legend is the distance range
    /// the stars' colour values were normalized against.
    struct Scene
    {
        std::string title;
        std::string axis_label = "Distance (parsecs)";
        f64 axis_bound = 1.0;
        ObserverMarker observer;
        std::vector<VisualPoint> stars;
        DistanceRange legend{};
        ColormapKind colormap = ColormapKind::Coolwarm;
        f32 star_alpha = 0.8f;
    };

    /// @brief Static utility class assembling a Scene.
    ///
    /// Axis bounds and title are derived here and nowhere else.
    class SceneBuilder
    {
    public:
        SceneBuilder() = delete;

        /// @brief Assemble the scene for one request.
        /// @param input Distance as entered by the user (for the title).
        /// @param max_distance_pc The same distance in parsecs (axis bounds).
        /// @param sample Stars with visual attributes.
        /// @param style Marker and colour settings.
        [[nodiscard]] static Scene build(const astro::DistanceInput& input,
                                         f64 max_distance_pc,
                                         VisualSample sample,
                                         const StyleConfig& style);

        /// @brief "Nearby Stars within 12.00 lyr".
        [[nodiscard]] static std::string make_title(const astro::DistanceInput& input);
    };

} // namespace nearstars::rendering
