/// @file pipeline.cpp
/// @brief Request orchestration.

#include "pipeline/pipeline.hpp"

#include "astro/projection.hpp"
#include "astro/units.hpp"
#include "core/logger.hpp"
#include "rendering/visual_mapper.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace nearstars::pipeline
{

Pipeline::Pipeline(catalog::CatalogClient& client, PipelineConfig config)
    : m_client{client}
    , m_config{std::move(config)}
{
}

PipelineOutcome Pipeline::prepare(const PipelineRequest& request)
{
    PipelineOutcome outcome;

    // -----------------------------------------------------------------
    // 1. Validate input and convert to parsecs
    // -----------------------------------------------------------------
    const auto unit = astro::Units::parse_unit(request.unit);
    if (!unit)
    {
        outcome.status = PipelineStatus::InvalidDistance;
        outcome.message = fmt::format("Unknown distance unit '{}'.", request.unit);
        NST_WARN("{}", outcome.message);
        return outcome;
    }

    const auto input = astro::Units::parse_distance(request.distance_text, *unit);
    const auto max_distance_pc = input ? astro::Units::to_parsecs(input->value, input->unit)
                                       : std::nullopt;
    if (!input || !max_distance_pc)
    {
        outcome.status = PipelineStatus::InvalidDistance;
        outcome.message = fmt::format("Invalid distance '{}': enter a positive number.",
                                      request.distance_text);
        NST_WARN("{}", outcome.message);
        return outcome;
    }

    // -----------------------------------------------------------------
    // 2. Build the query
    // -----------------------------------------------------------------
    outcome.query = catalog::QueryBuilder::build_query(*max_distance_pc, m_config.query);
    if (!outcome.query)
    {
        outcome.status = PipelineStatus::InvalidDistance;
        outcome.message = fmt::format("Invalid distance '{}'.", request.distance_text);
        return outcome;
    }

    NST_INFO("Searching for stars within {} {} ({:.4f} pc) via {}",
             input->value, astro::Units::symbol(input->unit), *max_distance_pc, m_client.name());

    // -----------------------------------------------------------------
    // 3. Catalog round trip
    // -----------------------------------------------------------------
    catalog::CatalogResult result = m_client.execute(*outcome.query);
    switch (result.status)
    {
        case catalog::CatalogStatus::Ok:
            break;

        case catalog::CatalogStatus::Unavailable:
            outcome.status = PipelineStatus::CatalogUnavailable;
            outcome.message = fmt::format("Catalog unavailable: {}", result.message);
            NST_ERROR("{}", outcome.message);
            return outcome;

        case catalog::CatalogStatus::QuerySyntaxError:
            outcome.status = PipelineStatus::QuerySyntaxError;
            outcome.message = fmt::format("Catalog rejected the query: {}", result.message);
            NST_ERROR("{}", outcome.message);
            return outcome;
    }

    outcome.rows_received = result.rows.size();

    // -----------------------------------------------------------------
    // 4. Distances + projection
    // -----------------------------------------------------------------
    auto projected = astro::Projection::project(result.rows);
    if (!projected)
    {
        outcome.status = PipelineStatus::EmptySample;
        outcome.message = "No nearby stars found within the specified distance.";
        NST_INFO("{}", outcome.message);
        return outcome;
    }

    // -----------------------------------------------------------------
    // 5. Visual attributes + scene
    // -----------------------------------------------------------------
    rendering::VisualSample sample = rendering::VisualMapper::map_attributes(*projected,
                                                                             m_config.style.points);
    outcome.points = sample.points.size();
    outcome.scene = rendering::SceneBuilder::build(*input, *max_distance_pc, std::move(sample),
                                                   m_config.style);

    outcome.status = PipelineStatus::Rendered;
    outcome.message = fmt::format("{} stars within {:.2f} {} (nearest {:.3f} pc, farthest {:.3f} pc).",
                                  outcome.points, input->value, astro::Units::symbol(input->unit),
                                  outcome.scene->legend.min_pc, outcome.scene->legend.max_pc);
    NST_INFO("{}", outcome.message);
    return outcome;
}

PipelineOutcome Pipeline::run(const PipelineRequest& request, rendering::Renderer& renderer)
{
    PipelineOutcome outcome = prepare(request);
    if (outcome.status != PipelineStatus::Rendered)
    {
        return outcome;
    }

    if (!renderer.render(*outcome.scene))
    {
        outcome.status = PipelineStatus::RenderFailed;
        outcome.message = "Rendering failed; see log for details.";
        NST_ERROR("{}", outcome.message);
    }
    return outcome;
}

std::string_view to_string(PipelineStatus status)
{
    switch (status)
    {
        case PipelineStatus::Rendered:           return "rendered";
        case PipelineStatus::EmptySample:        return "empty sample";
        case PipelineStatus::InvalidDistance:    return "invalid distance";
        case PipelineStatus::CatalogUnavailable: return "catalog unavailable";
        case PipelineStatus::QuerySyntaxError:   return "query syntax error";
        case PipelineStatus::RenderFailed:       return "render failed";
    }
    return "unknown";
}

} // namespace nearstars::pipeline
