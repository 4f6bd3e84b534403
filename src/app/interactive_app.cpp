/// @file interactive_app.cpp
/// @brief Interactive front end implementation.

#include "app/interactive_app.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace nearstars::app
{

InteractiveApp::InteractiveApp(pipeline::Pipeline& runner, std::string unit,
                               std::filesystem::path font_path,
                               const core::WindowConfig& window_config)
    : m_pipeline{runner}
    , m_unit{std::move(unit)}
    , m_font_path{std::move(font_path)}
{
    init(window_config);
}

InteractiveApp::~InteractiveApp()
{
    shutdown();
}

void InteractiveApp::init(const core::WindowConfig& window_config)
{
    m_window = std::make_unique<core::Window>(window_config);
    m_input = std::make_unique<core::Input>();

    // Wire SDL events → Input system
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

    if (!m_window->is_valid())
    {
        return;
    }

    m_renderer = std::make_unique<rendering::WindowRenderer>(*m_window, m_font_path);
    m_renderer->clear();

    SDL_StartTextInput();
    m_status = "type a distance and press Enter";
    refresh_title();

    NST_CORE_INFO("InteractiveApp initialized (unit: {})", m_unit);
}

void InteractiveApp::shutdown()
{
    if (m_window && m_window->is_valid())
    {
        SDL_StopTextInput();
    }

    m_renderer.reset();

    // Clear the event callback before destroying the window
    // (callback captures `this`, which references m_input)
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

bool InteractiveApp::run()
{
    if (!m_window || !m_window->is_valid() || !m_renderer)
    {
        NST_CRITICAL("Cannot start interactive mode: no window");
        return false;
    }

    NST_INFO("Interactive mode: enter a distance in {} and press Enter (Esc quits)", m_unit);
    main_loop();
    return true;
}

// =================================================================
// Main loop
// =================================================================

void InteractiveApp::main_loop()
{
    while (!m_window->should_close())
    {
        m_input->new_frame();
        m_window->poll_events(kEventWaitMs);

        if (m_input->is_key_pressed(SDL_SCANCODE_ESCAPE))
        {
            m_window->request_close();
            continue;
        }

        if (m_input->was_submitted())
        {
            submit();
        }
        else if (m_input->text_changed())
        {
            refresh_title();
        }

        if (m_window->needs_redraw())
        {
            if (m_scene)
            {
                if (!m_renderer->render(*m_scene))
                {
                    NST_ERROR("Repaint failed");
                }
                refresh_title();
            }
            else
            {
                m_renderer->clear();
            }
        }
    }
}

// Runs synchronously: the window does not process events until the query returns
void InteractiveApp::submit()
{
    m_status = "querying...";
    refresh_title();

    const pipeline::PipelineOutcome outcome = m_pipeline.run(
        pipeline::PipelineRequest{.distance_text = m_input->text(), .unit = m_unit},
        *m_renderer);

    m_status = outcome.message;

    if (outcome.status == pipeline::PipelineStatus::Rendered)
    {
        m_scene = outcome.scene;
    }
    else if (outcome.status == pipeline::PipelineStatus::RenderFailed)
    {
        m_scene.reset();
        m_renderer->clear();
    }

    refresh_title();
}

// The title bar doubles as the text field and status line
void InteractiveApp::refresh_title()
{
    const std::string plot = m_scene ? m_scene->title : std::string{"Nearby Stars"};
    m_window->set_title(fmt::format("{} | max distance ({}): {}_ | {}",
                                    plot, m_unit, m_input->text(), m_status));
}

} // namespace nearstars::app
