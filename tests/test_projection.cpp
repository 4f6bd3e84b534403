/// @file test_projection.cpp
/// @brief Unit tests for nearstars::astro::Projection.
///
/// Verifies parallax inversion, the plane mapping at cardinal angles, the
/// x² + y² <= d² bound and the empty-sample signal.

#include <doctest/doctest.h>

#include "astro/projection.hpp"
#include "core/types.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace nearstars;
using namespace nearstars::astro;
using test::make_row;

static constexpr f64 kTol = 1e-12;

// =================================================================
// Distance
// =================================================================

TEST_CASE("Parallax of 1 arcsec is 1 parsec")
{
    CHECK(Projection::parallax_to_distance_pc(1000.0) == doctest::Approx(1.0).epsilon(kTol));
    CHECK(Projection::parallax_to_distance_pc(768.0665) == doctest::Approx(1.30197).epsilon(1e-5)); // Proxima
}

TEST_CASE("Validity of parallax values")
{
    CHECK(Projection::has_valid_parallax(make_row(1, 0.0, 0.0, 12.0)));
    CHECK_FALSE(Projection::has_valid_parallax(make_row(1, 0.0, 0.0, std::nullopt)));
    CHECK_FALSE(Projection::has_valid_parallax(make_row(1, 0.0, 0.0, 0.0)));
    CHECK_FALSE(Projection::has_valid_parallax(make_row(1, 0.0, 0.0, -0.4)));
    CHECK_FALSE(Projection::has_valid_parallax(
        make_row(1, 0.0, 0.0, std::numeric_limits<f64>::quiet_NaN())));
}

// =================================================================
// Plane mapping
// =================================================================

TEST_CASE("RA 0, Dec 0 lies on +x")
{
    const std::vector rows{make_row(7, 0.0, 0.0, 1000.0)};
    const auto points = Projection::project(rows);
    REQUIRE(points.has_value());
    REQUIRE(points->size() == 1);

    const auto& p = points->front();
    CHECK(p.source_id == 7);
    CHECK(p.distance_pc == doctest::Approx(1.0).epsilon(kTol));
    CHECK(p.x == doctest::Approx(1.0).epsilon(kTol));
    CHECK(p.y == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("RA 90 lies on +y, RA 180 on -x")
{
    const std::vector rows{
        make_row(1, 90.0, 0.0, 500.0),
        make_row(2, 180.0, 0.0, 500.0),
    };
    const auto points = Projection::project(rows);
    REQUIRE(points.has_value());
    REQUIRE(points->size() == 2);

    CHECK((*points)[0].x == doctest::Approx(0.0).epsilon(kTol));
    CHECK((*points)[0].y == doctest::Approx(2.0).epsilon(kTol));
    CHECK((*points)[1].x == doctest::Approx(-2.0).epsilon(kTol));
    CHECK((*points)[1].y == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("Declination shortens the radius by cos(dec)")
{
    const Vec2d p = Projection::to_plane(0.0, astro_constants::kPi / 3.0, 4.0);
    CHECK(p.x == doctest::Approx(2.0).epsilon(kTol));
    CHECK(p.y == doctest::Approx(0.0).epsilon(kTol));

    const Vec2d pole = Projection::to_plane(1.0, astro_constants::kPi / 2.0, 4.0);
    CHECK(std::hypot(pole.x, pole.y) == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("Projected radius never exceeds the distance")
{
    std::vector<catalog::CatalogRow> rows;
    u64 id = 0;
    for (f64 ra = 0.0; ra < 360.0; ra += 23.0)
    {
        for (f64 dec = -90.0; dec <= 90.0; dec += 15.0)
        {
            rows.push_back(make_row(++id, ra, dec, 50.0 + ra / 10.0));
        }
    }

    const auto points = Projection::project(rows);
    REQUIRE(points.has_value());
    REQUIRE(points->size() == rows.size());

    for (const auto& p : *points)
    {
        CHECK(p.x * p.x + p.y * p.y <= p.distance_pc * p.distance_pc * (1.0 + 1e-12));
    }
}

// =================================================================
// Filtering
// =================================================================

TEST_CASE("Rows without a usable parallax are dropped, order kept")
{
    const std::vector rows{
        make_row(1, 10.0, 5.0, 100.0),
        make_row(2, 20.0, 5.0, 0.0),
        make_row(3, 30.0, 5.0, std::nullopt),
        make_row(4, 40.0, 5.0, -2.0),
        make_row(5, 50.0, 5.0, 250.0),
    };

    const auto points = Projection::project(rows);
    REQUIRE(points.has_value());
    REQUIRE(points->size() == 2);
    CHECK((*points)[0].source_id == 1);
    CHECK((*points)[1].source_id == 5);
    CHECK((*points)[0].distance_pc == doctest::Approx(10.0));
    CHECK((*points)[1].distance_pc == doctest::Approx(4.0));
}

TEST_CASE("No usable row gives an empty sample")
{
    const std::vector rows{
        make_row(1, 10.0, 5.0, 0.0),
        make_row(2, 20.0, 5.0, std::nullopt),
    };
    CHECK_FALSE(Projection::project(rows).has_value());
    CHECK_FALSE(Projection::project({}).has_value());
}
