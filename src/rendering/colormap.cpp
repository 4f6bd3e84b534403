/// @file colormap.cpp
/// @brief Control points for the supported colour scales.

#include "rendering/colormap.hpp"

#include "core/logger.hpp"
#include "core/parse.hpp"

#include <glm/common.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace nearstars::rendering
{

namespace
{

// Moreland's diverging blue-grey-red scale
const std::array<Vec3f, 5> kCoolwarm{{
    {0.230f, 0.299f, 0.754f},
    {0.552f, 0.690f, 0.996f},
    {0.865f, 0.865f, 0.865f},
    {0.958f, 0.603f, 0.482f},
    {0.706f, 0.016f, 0.150f},
}};

const std::array<Vec3f, 5> kViridis{{
    {0.267f, 0.005f, 0.329f},
    {0.229f, 0.322f, 0.546f},
    {0.128f, 0.567f, 0.551f},
    {0.369f, 0.789f, 0.383f},
    {0.993f, 0.906f, 0.144f},
}};

const std::array<Vec3f, 2> kGray{{
    {0.0f, 0.0f, 0.0f},
    {1.0f, 1.0f, 1.0f},
}};

} // anonymous namespace

Colormap::Colormap(ColormapKind kind)
{
    switch (kind)
    {
        case ColormapKind::Coolwarm: m_stops = kCoolwarm; break;
        case ColormapKind::Viridis:  m_stops = kViridis;  break;
        case ColormapKind::Gray:     m_stops = kGray;     break;
    }
}

Vec3f Colormap::sample(f64 t) const
{
    if (std::isnan(t))
    {
        t = 0.0;
    }
    t = std::clamp(t, 0.0, 1.0);

    const f64 scaled = t * static_cast<f64>(m_stops.size() - 1);
    const auto lower = std::min(static_cast<std::size_t>(scaled), m_stops.size() - 2);
    const auto frac = static_cast<f32>(scaled - static_cast<f64>(lower));

    return glm::mix(m_stops[lower], m_stops[lower + 1], frac);
}

std::optional<ColormapKind> Colormap::parse(std::string_view name)
{
    const std::string key = core::to_lower(name);
    if (key == "coolwarm") return ColormapKind::Coolwarm;
    if (key == "viridis")  return ColormapKind::Viridis;
    if (key == "gray" || key == "grey") return ColormapKind::Gray;

    NST_CORE_ERROR("Colormap: unknown colour scale '{}'", name);
    return std::nullopt;
}

std::string_view Colormap::name(ColormapKind kind)
{
    switch (kind)
    {
        case ColormapKind::Coolwarm: return "coolwarm";
        case ColormapKind::Viridis:  return "viridis";
        case ColormapKind::Gray:     return "gray";
    }
    return "?";
}

} // namespace nearstars::rendering
