#pragma once

/// @file colormap.hpp
/// @brief Piecewise-linear colour scales mapping [0, 1] to RGB.

#include "core/types.hpp"
#include "rendering/style.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace nearstars::rendering
{
    /// @brief A colour scale sampled at evenly spaced control points.
    class Colormap
    {
    public:
        explicit Colormap(ColormapKind kind = ColormapKind::Coolwarm);

        /// @brief Colour at @p t, clamped to [0, 1]. Components in [0, 1].
        [[nodiscard]] Vec3f sample(f64 t) const;

        /// @brief Look up a scale by name ("coolwarm", "viridis", "gray").
        [[nodiscard]] static std::optional<ColormapKind> parse(std::string_view name);

        [[nodiscard]] static std::string_view name(ColormapKind kind);

    private:
        std::span<const Vec3f> m_stops;
    };

} // namespace nearstars::rendering
