#pragma once

/// @file window.hpp
/// @brief SDL2 window wrapper used by the interactive and windowed outputs.

#include "core/logger.hpp"

#include <SDL2/SDL.h>

#include <cstdint>
#include <functional>
#include <string>

namespace nearstars::core
{
    /// @brief Configuration for window creation.
    /// Use designated initializers: Window w({.title = "Nearby Stars", .width = 900});
    struct WindowConfig
    {
        std::string title = "Nearby Stars";
        uint32_t width = 800;
        uint32_t height = 800;
        bool resizable = true;
    };

    /// @brief Callback type for receiving raw SDL events from the window.
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief SDL2 window wrapper with event polling.
    ///
    /// Owns the SDL_Window lifetime. Handles SDL_QUIT, window close, resize and
    /// expose events. Non-copyable.
    class Window
    {
    public:
        /// @brief Create and show an SDL2 window.
        /// Check is_valid() afterwards; failures are logged.
        explicit Window(const WindowConfig& config);

        /// @brief Destroy the SDL2 window and shut down the SDL video subsystem.
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        /// @brief True if SDL and the window were created successfully.
        [[nodiscard]] bool is_valid() const;

        /// @brief Returns true if the window has been requested to close.
        [[nodiscard]] bool should_close() const;

        /// @brief Request the window to close (e.g., from Escape key).
        void request_close();

        /// @brief Wait up to @p timeout_ms for an event, then drain the queue.
        /// If an event callback is set, it is called for every event.
        void poll_events(int timeout_ms = 0);

        /// @brief Set a callback to receive all SDL events during poll_events().
        /// @param callback The callback function, or nullptr to clear.
        void set_event_callback(EventCallback callback);

        /// @brief Replace the title bar text.
        void set_title(const std::string& title);

        /// @brief Access the underlying SDL_Window pointer.
        [[nodiscard]] SDL_Window* get_native_handle() const;

        /// @brief Returns true if the contents must be redrawn (resize or expose)
        /// since the last call. Resets the flag after reading.
        [[nodiscard]] bool needs_redraw();

    private:
        void handle_window_event(const SDL_WindowEvent& event);

        SDL_Window* m_window = nullptr;
        bool m_sdl_initialized = false;
        uint32_t m_width = 0;
        uint32_t m_height = 0;
        bool m_should_close = false;
        bool m_needs_redraw = false;
        EventCallback m_event_callback;
    };

} // namespace nearstars::core
