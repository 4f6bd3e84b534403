/// @file window.cpp
/// @brief SDL2 window implementation.

#include "core/window.hpp"

#include <utility>

namespace nearstars::core
{

Window::Window(const WindowConfig& config)
    : m_width{config.width}
    , m_height{config.height}
{
    // -----------------------------------------------------------------
    // Tell SDL we manage our own entry point (no SDL_main hijack)
    // -----------------------------------------------------------------
    SDL_SetMainReady();

    // -----------------------------------------------------------------
    // Initialize SDL video subsystem
    // -----------------------------------------------------------------
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0)
    {
        NST_CORE_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        return;
    }
    m_sdl_initialized = true;

    uint32_t flags = SDL_WINDOW_SHOWN;
    if (config.resizable)
    {
        flags |= SDL_WINDOW_RESIZABLE;
    }

    m_window = SDL_CreateWindow(
        config.title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        static_cast<int>(config.width),
        static_cast<int>(config.height),
        flags);

    if (m_window == nullptr)
    {
        NST_CORE_CRITICAL("SDL_CreateWindow failed: {}", SDL_GetError());
        return;
    }

    m_needs_redraw = true;

    NST_CORE_INFO("Window created: \"{}\" ({}x{}) [{}]",
                  config.title,
                  m_width,
                  m_height,
                  config.resizable ? "resizable" : "fixed");
}

Window::~Window()
{
    if (m_window != nullptr)
    {
        SDL_DestroyWindow(m_window);
        NST_CORE_INFO("Window destroyed");
    }

    if (m_sdl_initialized)
    {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }
}

bool Window::is_valid() const
{
    return m_window != nullptr;
}

bool Window::should_close() const
{
    return m_should_close;
}

void Window::request_close()
{
    m_should_close = true;
}

void Window::poll_events(int timeout_ms)
{
    SDL_Event event{};

    // Block for the first event so an idle window does not spin
    int has_event = timeout_ms > 0 ? SDL_WaitEventTimeout(&event, timeout_ms)
                                   : SDL_PollEvent(&event);

    while (has_event != 0)
    {
        switch (event.type)
        {
            case SDL_QUIT:
            {
                m_should_close = true;
                break;
            }

            case SDL_WINDOWEVENT:
            {
                handle_window_event(event.window);
                break;
            }

            default:
                break;
        }

        if (m_event_callback)
        {
            m_event_callback(event);
        }

        has_event = SDL_PollEvent(&event);
    }
}

void Window::handle_window_event(const SDL_WindowEvent& event)
{
    switch (event.event)
    {
        case SDL_WINDOWEVENT_CLOSE:
        {
            m_should_close = true;
            break;
        }

        case SDL_WINDOWEVENT_RESIZED:
        case SDL_WINDOWEVENT_SIZE_CHANGED:
        {
            m_width = static_cast<uint32_t>(event.data1);
            m_height = static_cast<uint32_t>(event.data2);
            m_needs_redraw = true;
            NST_CORE_TRACE("Window resized: {}x{}", m_width, m_height);
            break;
        }

        case SDL_WINDOWEVENT_EXPOSED:
        case SDL_WINDOWEVENT_RESTORED:
        {
            m_needs_redraw = true;
            break;
        }

        default:
            break;
    }
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

void Window::set_title(const std::string& title)
{
    if (m_window != nullptr)
    {
        SDL_SetWindowTitle(m_window, title.c_str());
    }
}

SDL_Window* Window::get_native_handle() const
{
    return m_window;
}

bool Window::needs_redraw()
{
    bool redraw = m_needs_redraw;
    m_needs_redraw = false;
    return redraw;
}

} // namespace nearstars::core
