/// @file test_console_renderer.cpp
/// @brief Unit tests for SceneBuilder and the character-grid renderer.

#include <doctest/doctest.h>

#include "astro/units.hpp"
#include "rendering/console_renderer.hpp"
#include "rendering/scene.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace nearstars;
using namespace nearstars::rendering;

namespace
{

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}

VisualPoint star_at(f64 x, f64 y, f64 normalized)
{
    return VisualPoint{
        .point      = astro::ProjectedPoint{.source_id = 1, .distance_pc = 1.0, .x = x, .y = y},
        .normalized = normalized,
        .size       = 50.0,
        .color      = 1.0 - normalized,
    };
}

Scene make_scene(std::vector<VisualPoint> stars)
{
    Scene scene;
    scene.title = "Nearby Stars within 10.00 pc";
    scene.axis_bound = 10.0;
    scene.stars = std::move(stars);
    scene.legend = DistanceRange{.min_pc = 1.0, .max_pc = 9.0};
    return scene;
}

// 23 wide -> 21 grid columns; 11 rows; grid starts on line 3
constexpr ConsoleConfig kSmall{.width = 23, .height = 11, .ansi_color = false};
constexpr std::size_t kFirstGridLine = 3;
constexpr std::size_t kCentreLine = kFirstGridLine + 5;

} // anonymous namespace

// =================================================================
// SceneBuilder
// =================================================================

TEST_CASE("Title shows the entered distance and unit symbol")
{
    CHECK(SceneBuilder::make_title({.value = 10.0, .unit = astro::LengthUnit::LightYear}) ==
          "Nearby Stars within 10.00 lyr");
    CHECK(SceneBuilder::make_title({.value = 2.5, .unit = astro::LengthUnit::Parsec}) ==
          "Nearby Stars within 2.50 pc");
}

TEST_CASE("Axis bound is the query distance in parsecs")
{
    const VisualSample sample{.points = {star_at(1.0, 1.0, 0.0)}, .range = {.min_pc = 1.4, .max_pc = 1.4}};
    const Scene scene = SceneBuilder::build({.value = 10.0, .unit = astro::LengthUnit::LightYear},
                                            3.0660139378555057, sample, StyleConfig{});

    CHECK(scene.axis_bound == doctest::Approx(3.0660139378555057));
    CHECK(scene.axis_label == "Distance (parsecs)");
    CHECK(scene.observer.label == "Sun");
    CHECK(scene.stars.size() == 1);
    CHECK(scene.legend.min_pc == doctest::Approx(1.4));
}

// =================================================================
// ConsoleRenderer
// =================================================================

TEST_CASE("Glyphs step from near to far")
{
    CHECK(ConsoleRenderer::distance_glyph(0.0) == '#');
    CHECK(ConsoleRenderer::distance_glyph(0.3) == '*');
    CHECK(ConsoleRenderer::distance_glyph(0.5) == 'o');
    CHECK(ConsoleRenderer::distance_glyph(0.7) == '+');
    CHECK(ConsoleRenderer::distance_glyph(1.0) == '.');
}

TEST_CASE("Observer sits at the grid centre")
{
    std::ostringstream out;
    ConsoleRenderer renderer(out, kSmall);
    REQUIRE(renderer.render(make_scene({})));

    const auto lines = split_lines(out.str());
    REQUIRE(lines.size() > kCentreLine);
    CHECK(lines[1].find("Nearby Stars") != std::string::npos);
    CHECK(lines[kCentreLine][1 + 10] == '@');
}

TEST_CASE("Stars land on the expected cells, north up")
{
    std::ostringstream out;
    ConsoleRenderer renderer(out, kSmall);
    REQUIRE(renderer.render(make_scene({
        star_at(10.0, 0.0, 0.0),    // east edge, nearest
        star_at(0.0, 10.0, 1.0),    // top centre, farthest
    })));

    const auto lines = split_lines(out.str());
    CHECK(lines[kCentreLine][1 + 20] == '#');
    CHECK(lines[kFirstGridLine][1 + 10] == '.');
}

TEST_CASE("Nearer star wins a shared cell")
{
    std::ostringstream out;
    ConsoleRenderer renderer(out, kSmall);
    REQUIRE(renderer.render(make_scene({
        star_at(-10.0, -10.0, 0.9),
        star_at(-10.0, -10.0, 0.1),
    })));

    const auto lines = split_lines(out.str());
    CHECK(lines[kFirstGridLine + 10][1] == '#');
}

TEST_CASE("Stars outside the axes are counted, not drawn")
{
    std::ostringstream out;
    ConsoleRenderer renderer(out, kSmall);
    REQUIRE(renderer.render(make_scene({star_at(50.0, 0.0, 0.0), star_at(1.0, 1.0, 0.0)})));
    CHECK(out.str().find("1 plotted, 1 outside the axes") != std::string::npos);
}

TEST_CASE("Unusable viewport is refused")
{
    std::ostringstream out;
    ConsoleRenderer renderer(out, ConsoleConfig{.width = 8, .height = 2, .ansi_color = false});
    CHECK_FALSE(renderer.render(make_scene({})));
}
