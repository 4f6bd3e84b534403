#pragma once

/// @file style.hpp
/// @brief Presentation settings shared by the attribute mapper, scene and renderers.

#include "core/types.hpp"

#include <string>

namespace nearstars::rendering
{
    /// @brief Diverging / sequential colour scales for the distance encoding.
    enum class ColormapKind : u8
    {
        Coolwarm,
        Viridis,
        Gray,
    };

    /// @brief Marker size range for catalog stars (matplotlib-style area units).
    struct PointStyle
    {
        f64 min_size = 10.0;    ///< Farthest star
        f64 max_size = 100.0;   ///< Nearest star
    };

    /// @brief Fixed marker for the observer at the origin.
    struct ObserverMarker
    {
        std::string label = "Sun";
        f64 size = 200.0;
        Vec3f core_color{1.0f, 1.0f, 0.0f};         ///< yellow
        Vec3f glow_color{1.0f, 0.647f, 0.0f};       ///< orange
        f32 glow_alpha = 0.3f;
        f64 glow_scale = 1.7;                       ///< Glow radius / core radius
    };

    /// @brief All presentation settings.
    struct StyleConfig
    {
        PointStyle points;
        ObserverMarker observer;
        ColormapKind colormap = ColormapKind::Coolwarm;
        f32 star_alpha = 0.8f;
    };

} // namespace nearstars::rendering
