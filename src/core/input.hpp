#pragma once

/// @file input.hpp
/// @brief SDL2 input state tracker: keyboard and a single-line numeric text field.
///
/// Input only tracks state. The interactive app reads it each frame and
/// decides what to do (run a query, quit, refresh the title).

#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <string>
#include <unordered_set>

namespace nearstars::core
{
    /// @brief Tracks per-frame key state and the contents of the distance field.
    ///
    /// Usage pattern each frame:
    ///   1. Call new_frame() to reset per-frame state
    ///   2. For each SDL_Event from Window::poll_events(), call process_event()
    ///   3. Query state: was_submitted(), text(), text_changed(), is_key_pressed()
    class Input
    {
    public:
        Input() = default;
        ~Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        /// @brief Process a single SDL event. Call for each event polled this frame.
        void process_event(const SDL_Event& event);

        /// @brief Reset per-frame state. Call at the start of each frame before processing events.
        void new_frame();

        // -----------------------------------------------------------------
        // Text field
        // -----------------------------------------------------------------

        /// @brief Current contents of the distance field.
        [[nodiscard]] const std::string& text() const;

        /// @brief True if the field was edited this frame.
        [[nodiscard]] bool text_changed() const;

        /// @brief True if Enter was pressed this frame.
        [[nodiscard]] bool was_submitted() const;

        /// @brief Append characters typed by the user, keeping only those a number can contain.
        void append_text(const char* utf8);

        /// @brief Remove the last character of the field.
        void erase_last();

        // -----------------------------------------------------------------
        // Keyboard state
        // -----------------------------------------------------------------

        /// @brief True if the key was pressed (went down) THIS frame only.
        [[nodiscard]] bool is_key_pressed(SDL_Scancode key) const;


        /// @brief Longest accepted field length.
        static constexpr std::size_t kMaxTextLength = 24;

    private:
        // Text field
        std::string m_text;
        bool m_text_changed = false;
        bool m_submitted = false;

        // Keyboard
        std::unordered_set<SDL_Scancode> m_keys_pressed;    ///< This frame only
    };

} // namespace nearstars::core
