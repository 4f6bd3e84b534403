#pragma once

/// @file text_painter.hpp
/// @brief TrueType text drawing onto an SDL_Renderer (SDL2_ttf).

#include "core/types.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <filesystem>
#include <string_view>

namespace nearstars::rendering
{
    /// @brief Font used for a piece of text.
    enum class FontRole : u8
    {
        Title,
        Label,
    };

    /// @brief Which point of the text box (x, y) refers to.
    enum class TextAnchor : u8
    {
        TopLeft,
        TopCentre,
        MiddleLeft,
        MiddleRight,
        Centre,
    };

    /// @brief Owns a title and a label font opened from one TrueType file.
    ///
    /// An invalid painter (no path, unreadable font) draws nothing; callers
    /// check is_valid() and lay out the plot the same either way.
    class TextPainter
    {
    public:
        static constexpr int kTitlePointSize = 18;
        static constexpr int kLabelPointSize = 12;

        explicit TextPainter(const std::filesystem::path& font_path);
        ~TextPainter();

        TextPainter(const TextPainter&) = delete;
        TextPainter& operator=(const TextPainter&) = delete;
        TextPainter(TextPainter&&) = delete;
        TextPainter& operator=(TextPainter&&) = delete;

        [[nodiscard]] bool is_valid() const;

        /// @brief Draw @p text with its @p anchor point at (x, y).
        /// @param angle_deg Clockwise rotation about the text centre.
        /// @return false if SDL_ttf or SDL failed (cause is logged).
        [[nodiscard]] bool draw(SDL_Renderer* renderer, std::string_view text,
                                int x, int y, TextAnchor anchor, Vec3f color,
                                FontRole role = FontRole::Label, f64 angle_deg = 0.0) const;

    private:
        bool m_ttf_initialized = false;
        TTF_Font* m_title_font = nullptr;
        TTF_Font* m_label_font = nullptr;
    };

} // namespace nearstars::rendering
