/// @file scene.cpp
/// @brief Scene assembly.

#include "rendering/scene.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace nearstars::rendering
{

Scene SceneBuilder::build(const astro::DistanceInput& input,
                          f64 max_distance_pc,
                          VisualSample sample,
                          const StyleConfig& style)
{
    Scene scene;
    scene.title      = make_title(input);
    scene.axis_bound = max_distance_pc;
    scene.observer   = style.observer;
    scene.stars      = std::move(sample.points);
    scene.legend     = sample.range;
    scene.colormap   = style.colormap;
    scene.star_alpha = style.star_alpha;
    return scene;
}

std::string SceneBuilder::make_title(const astro::DistanceInput& input)
{
    return fmt::format("Nearby Stars within {:.2f} {}", input.value, astro::Units::symbol(input.unit));
}

} // namespace nearstars::rendering
