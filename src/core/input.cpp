/// @file input.cpp
/// @brief SDL2 input state tracker implementation.

#include "core/input.hpp"

#include <cstring>

namespace nearstars::core
{

// -----------------------------------------------------------------
// new_frame: reset per-frame state
// -----------------------------------------------------------------

void Input::new_frame()
{
    m_text_changed = false;
    m_submitted = false;
    m_keys_pressed.clear();
}

// -----------------------------------------------------------------
// process_event: dispatch SDL events to state tracking
// -----------------------------------------------------------------

void Input::process_event(const SDL_Event& event)
{
    switch (event.type)
    {
        // -----------------------------------------------------------------
        // Typed characters (SDL_StartTextInput must be active)
        // -----------------------------------------------------------------
        case SDL_TEXTINPUT:
        {
            append_text(event.text.text);
            break;
        }

        // -----------------------------------------------------------------
        // Keyboard
        // -----------------------------------------------------------------
        case SDL_KEYDOWN:
        {
            const SDL_Scancode sc = event.key.keysym.scancode;
            if (event.key.repeat == 0)
            {
                m_keys_pressed.insert(sc);
            }

            if (sc == SDL_SCANCODE_BACKSPACE)
            {
                erase_last();
            }
            else if ((sc == SDL_SCANCODE_RETURN || sc == SDL_SCANCODE_KP_ENTER) && event.key.repeat == 0)
            {
                m_submitted = true;
            }
            break;
        }

        default:
            break;
    }
}

// -----------------------------------------------------------------
// Text field
// -----------------------------------------------------------------

void Input::append_text(const char* utf8)
{
    for (const char* c = utf8; *c != '\0'; ++c)
    {
        const bool numeric = (*c >= '0' && *c <= '9') || std::strchr(".eE+-", *c) != nullptr;
        if (numeric && m_text.size() < kMaxTextLength)
        {
            m_text.push_back(*c);
            m_text_changed = true;
        }
    }
}

void Input::erase_last()
{
    if (!m_text.empty())
    {
        m_text.pop_back();
        m_text_changed = true;
    }
}

const std::string& Input::text() const
{
    return m_text;
}

bool Input::text_changed() const
{
    return m_text_changed;
}

bool Input::was_submitted() const
{
    return m_submitted;
}

bool Input::is_key_pressed(SDL_Scancode key) const
{
    return m_keys_pressed.contains(key);
}


} // namespace nearstars::core
