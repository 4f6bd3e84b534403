/// @file main.cpp
/// @brief NearStars entry point: single-shot (console / image / window) or interactive.

#include "app/interactive_app.hpp"
#include "catalog/file_catalog_client.hpp"
#include "catalog/gaia_tap_client.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/window.hpp"
#include "pipeline/pipeline.hpp"
#include "rendering/console_renderer.hpp"
#include "rendering/sdl_renderer.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace nearstars;

namespace
{

std::unique_ptr<catalog::CatalogClient> make_catalog_client(const core::AppConfig& config)
{
    switch (config.source)
    {
        case core::CatalogSource::File:
            return std::make_unique<catalog::FileCatalogClient>(config.catalog_file);
        case core::CatalogSource::Gaia:
            break;
    }
    return std::make_unique<catalog::GaiaTapClient>(config.tap);
}

int exit_code_for(pipeline::PipelineStatus status)
{
    switch (status)
    {
        case pipeline::PipelineStatus::Rendered:
        case pipeline::PipelineStatus::EmptySample:
            return 0;
        case pipeline::PipelineStatus::InvalidDistance:
            return 2;
        case pipeline::PipelineStatus::CatalogUnavailable:
        case pipeline::PipelineStatus::QuerySyntaxError:
            return 3;
        case pipeline::PipelineStatus::RenderFailed:
            return 4;
    }
    return 1;
}

// Keep the window up until the user closes it, repainting on expose/resize
void show_until_closed(core::Window& window, rendering::WindowRenderer& renderer,
                       const rendering::Scene& scene)
{
    while (!window.should_close())
    {
        window.poll_events(100);
        if (window.needs_redraw() && !renderer.render(scene))
        {
            NST_ERROR("Repaint failed");
            return;
        }
    }
}

int run_single_shot(pipeline::Pipeline& runner, const core::AppConfig& config)
{
    pipeline::PipelineRequest request{.distance_text = config.distance_text, .unit = config.unit};

    if (request.distance_text.empty())
    {
        std::cout << "Enter the maximum distance in " << config.unit << ": " << std::flush;
        if (!std::getline(std::cin, request.distance_text))
        {
            NST_ERROR("No distance given");
            return 2;
        }
    }

    pipeline::PipelineOutcome outcome;

    switch (config.output)
    {
        case core::OutputKind::Console:
        {
            rendering::ConsoleRenderer renderer(std::cout, config.console);
            outcome = runner.run(request, renderer);
            break;
        }

        case core::OutputKind::Image:
        {
            rendering::ImageRenderer renderer(config.image_path, config.image_width, config.image_height,
                                              config.font_path);
            outcome = runner.run(request, renderer);
            break;
        }

        case core::OutputKind::Window:
        {
            // Resolve the request before opening a window, so errors never flash one up
            outcome = runner.prepare(request);
            if (outcome.status != pipeline::PipelineStatus::Rendered)
            {
                break;
            }

            core::Window window(core::WindowConfig{.title = outcome.scene->title});
            rendering::WindowRenderer renderer(window, config.font_path);
            if (!window.is_valid() || !renderer.render(*outcome.scene))
            {
                outcome.status = pipeline::PipelineStatus::RenderFailed;
                outcome.message = "Rendering failed; see log for details.";
                break;
            }
            std::cout << outcome.message << '\n';
            show_until_closed(window, renderer, *outcome.scene);
            return 0;
        }
    }

    std::cout << outcome.message << '\n';
    return exit_code_for(outcome.status);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    const auto config = core::CommandLine::parse(argc, argv);
    if (!config)
    {
        core::CommandLine::print_help(std::cerr);
        core::Logger::shutdown();
        return 2;
    }

    if (config->show_help)
    {
        core::CommandLine::print_help(std::cout);
        core::Logger::shutdown();
        return 0;
    }

    core::Logger::set_level(config->log_level);

    int exit_code = 0;
    {
        const auto client = make_catalog_client(*config);
        pipeline::Pipeline runner(*client, pipeline::PipelineConfig{
            .query = config->query,
            .style = config->style,
        });

        if (config->interactive)
        {
            app::InteractiveApp interactive(runner, config->unit, config->font_path);
            exit_code = interactive.run() ? 0 : 1;
        }
        else
        {
            exit_code = run_single_shot(runner, *config);
        }
    }

    core::Logger::shutdown();
    return exit_code;
}
