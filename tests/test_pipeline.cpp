/// @file test_pipeline.cpp
/// @brief End-to-end tests of the request pipeline against stand-in catalog and renderer.

#include <doctest/doctest.h>

#include "pipeline/pipeline.hpp"
#include "test_helpers.hpp"

#include <vector>

using namespace nearstars;
using namespace nearstars::pipeline;
using nearstars::catalog::CatalogResult;
using nearstars::catalog::CatalogStatus;
using test::make_row;

namespace
{

CatalogResult ok_rows(catalog::ResultSet rows)
{
    return CatalogResult{.status = CatalogStatus::Ok, .rows = std::move(rows), .message = {}};
}

CatalogResult failure(CatalogStatus status, std::string message)
{
    return CatalogResult{.status = status, .rows = {}, .message = std::move(message)};
}

} // anonymous namespace

// =================================================================
// Input validation
// =================================================================

TEST_CASE("Invalid distances never reach the catalog")
{
    test::FakeCatalogClient client(ok_rows({}));
    test::RecordingRenderer renderer;
    Pipeline runner(client, PipelineConfig{});

    const std::vector<PipelineRequest> requests{
        {.distance_text = "-5", .unit = "ly"},
        {.distance_text = "0", .unit = "ly"},
        {.distance_text = "abc", .unit = "ly"},
        {.distance_text = "", .unit = "ly"},
        {.distance_text = "1e400", .unit = "ly"},
        {.distance_text = "1e308", .unit = "Mpc"},      // overflows to inf pc
        {.distance_text = "1e-300", .unit = "m"},       // denormal pc
        {.distance_text = "1e-306", .unit = "pc"},      // threshold overflows
    };

    for (const auto& request : requests)
    {
        CAPTURE(request.distance_text);
        CAPTURE(request.unit);
        const PipelineOutcome outcome = runner.run(request, renderer);
        CHECK(outcome.status == PipelineStatus::InvalidDistance);
        CHECK_FALSE(outcome.message.empty());
    }

    CHECK(client.queries.empty());
    CHECK(renderer.scenes.empty());
}

TEST_CASE("Leading plus sign reaches the catalog")
{
    test::FakeCatalogClient client(ok_rows({}));
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.prepare({.distance_text = "+5", .unit = "pc"});
    CHECK(outcome.status == PipelineStatus::EmptySample);
    REQUIRE(client.queries.size() == 1);
    CHECK(client.queries[0].max_distance_pc == doctest::Approx(5.0));
}

TEST_CASE("Unknown unit is an invalid distance")
{
    test::FakeCatalogClient client(ok_rows({}));
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.prepare({.distance_text = "10", .unit = "furlong"});
    CHECK(outcome.status == PipelineStatus::InvalidDistance);
    CHECK(client.queries.empty());
}

// =================================================================
// Catalog outcomes
// =================================================================

TEST_CASE("Query is built from the converted distance")
{
    test::FakeCatalogClient client(ok_rows({}));
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.prepare({.distance_text = "10", .unit = "pc"});
    REQUIRE(client.queries.size() == 1);
    CHECK(client.queries[0].max_distance_pc == doctest::Approx(10.0));
    CHECK(client.queries[0].min_parallax_arcsec == doctest::Approx(0.1));
    REQUIRE(outcome.query.has_value());
    CHECK(outcome.query->adql == client.queries[0].adql);
}

TEST_CASE("Empty result is reported, nothing drawn")
{
    test::FakeCatalogClient client(ok_rows({make_row(1, 0.0, 0.0, std::nullopt), make_row(2, 0.0, 0.0, -3.0)}));
    test::RecordingRenderer renderer;
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.run({.distance_text = "10", .unit = "ly"}, renderer);
    CHECK(outcome.status == PipelineStatus::EmptySample);
    CHECK(outcome.message == "No nearby stars found within the specified distance.");
    CHECK(outcome.rows_received == 2);
    CHECK_FALSE(outcome.scene.has_value());
    CHECK(renderer.scenes.empty());
}

TEST_CASE("Catalog failures map to pipeline statuses")
{
    test::RecordingRenderer renderer;

    SUBCASE("unavailable")
    {
        test::FakeCatalogClient client(failure(CatalogStatus::Unavailable, "timeout"));
        Pipeline runner(client, PipelineConfig{});
        const PipelineOutcome outcome = runner.run({.distance_text = "10", .unit = "ly"}, renderer);
        CHECK(outcome.status == PipelineStatus::CatalogUnavailable);
        CHECK(outcome.message.find("timeout") != std::string::npos);
    }

    SUBCASE("syntax error")
    {
        test::FakeCatalogClient client(failure(CatalogStatus::QuerySyntaxError, "bad token"));
        Pipeline runner(client, PipelineConfig{});
        const PipelineOutcome outcome = runner.run({.distance_text = "10", .unit = "ly"}, renderer);
        CHECK(outcome.status == PipelineStatus::QuerySyntaxError);
        CHECK(outcome.message.find("bad token") != std::string::npos);
    }

    CHECK(renderer.scenes.empty());
}

// =================================================================
// Rendering
// =================================================================

TEST_CASE("Usable rows produce exactly one rendered scene")
{
    test::FakeCatalogClient client(ok_rows({
        make_row(1, 0.0, 0.0, 1000.0),      // 1 pc
        make_row(2, 90.0, 0.0, 500.0),      // 2 pc
        make_row(3, 180.0, 0.0, std::nullopt),
    }));
    test::RecordingRenderer renderer;
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.run({.distance_text = "10", .unit = "ly"}, renderer);
    REQUIRE(outcome.status == PipelineStatus::Rendered);
    CHECK(outcome.rows_received == 3);
    CHECK(outcome.points == 2);

    REQUIRE(renderer.scenes.size() == 1);
    const rendering::Scene& scene = renderer.scenes.front();
    CHECK(scene.title == "Nearby Stars within 10.00 lyr");
    CHECK(scene.axis_bound == doctest::Approx(3.0660139378555057));
    REQUIRE(scene.stars.size() == 2);
    CHECK(scene.stars[0].size == doctest::Approx(100.0));
    CHECK(scene.stars[1].size == doctest::Approx(10.0));
    CHECK(scene.legend.min_pc == doctest::Approx(1.0));
    CHECK(scene.legend.max_pc == doctest::Approx(2.0));
}

TEST_CASE("Renderer failure is reported")
{
    test::FakeCatalogClient client(ok_rows({make_row(1, 0.0, 0.0, 1000.0)}));
    test::RecordingRenderer renderer(false);
    Pipeline runner(client, PipelineConfig{});

    const PipelineOutcome outcome = runner.run({.distance_text = "5", .unit = "pc"}, renderer);
    CHECK(outcome.status == PipelineStatus::RenderFailed);
    CHECK(outcome.scene.has_value());
    CHECK(renderer.scenes.size() == 1);
}

TEST_CASE("Configured style reaches the scene")
{
    test::FakeCatalogClient client(ok_rows({make_row(1, 0.0, 0.0, 1000.0)}));
    PipelineConfig config;
    config.style.points = rendering::PointStyle{.min_size = 2.0, .max_size = 8.0};
    config.style.colormap = rendering::ColormapKind::Viridis;
    config.query.row_limit = 25;
    Pipeline runner(client, config);

    const PipelineOutcome outcome = runner.prepare({.distance_text = "5", .unit = "pc"});
    REQUIRE(outcome.scene.has_value());
    CHECK(outcome.scene->colormap == rendering::ColormapKind::Viridis);
    CHECK(outcome.scene->stars[0].size == doctest::Approx(8.0));
    REQUIRE(client.queries.size() == 1);
    CHECK(client.queries[0].adql.find("TOP 25") != std::string::npos);
}
