#pragma once

/// @file pipeline.hpp
/// @brief One request end to end: distance text -> query -> rows -> scene -> renderer.

#include "catalog/catalog_client.hpp"
#include "catalog/query_builder.hpp"
#include "rendering/renderer.hpp"
#include "rendering/scene.hpp"
#include "rendering/style.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace nearstars::pipeline
{
    /// @brief Terminal state of one request.
    enum class PipelineStatus : u8
    {
        Rendered,               ///< Scene produced and drawn
        EmptySample,            ///< No star with a usable parallax; nothing drawn
        InvalidDistance,        ///< Rejected before any query was built
        CatalogUnavailable,
        QuerySyntaxError,
        RenderFailed,
    };

    /// @brief Raw user input for one request.
    struct PipelineRequest
    {
        std::string distance_text;
        std::string unit = "ly";
    };

    /// @brief Settings that stay fixed across requests.
    struct PipelineConfig
    {
        catalog::QueryOptions query;
        rendering::StyleConfig style;
    };

    /// @brief What happened, with enough detail to tell the user.
    ///
    /// @c scene is set for Rendered and RenderFailed only.
    struct PipelineOutcome
    {
        PipelineStatus status = PipelineStatus::InvalidDistance;
        std::string message;
        std::size_t rows_received = 0;
        std::size_t points = 0;
        std::optional<catalog::QueryDescriptor> query;
        std::optional<rendering::Scene> scene;
    };

    /// @brief Runs the transform chain synchronously, one request at a time.
    ///
    /// Holds no state between requests besides its configuration and the
    /// borrowed catalog client, which must outlive the pipeline.
    class Pipeline
    {
    public:
        Pipeline(catalog::CatalogClient& client, PipelineConfig config);

        /// @brief Validate, query, project and map. Does not render.
        /// On success the outcome status is Rendered and @c scene is set.
        [[nodiscard]] PipelineOutcome prepare(const PipelineRequest& request);

        /// @brief prepare() and, if it produced a scene, hand it to @p renderer.
        /// The renderer is not called for any other status.
        [[nodiscard]] PipelineOutcome run(const PipelineRequest& request,
                                          rendering::Renderer& renderer);

    private:
        catalog::CatalogClient& m_client;
        PipelineConfig m_config;
    };

    /// @brief Printable name of a status value.
    [[nodiscard]] std::string_view to_string(PipelineStatus status);

} // namespace nearstars::pipeline
