#pragma once

/// @file console_renderer.hpp
/// @brief Terminal renderer: the scene as an ASCII/ANSI character plot.

#include "rendering/colormap.hpp"
#include "rendering/renderer.hpp"

#include <ostream>

namespace nearstars::rendering
{
    /// @brief Console viewport settings.
    struct ConsoleConfig
    {
        u32 width = 79;         ///< Total characters per line, frame included
        u32 height = 35;        ///< Plot rows, frame excluded
        bool ansi_color = false; ///< Emit 24-bit ANSI colour escapes for stars
    };

    /// @brief Draws the plane top-down in a character grid.
    ///
    /// The observer is '@' at the grid centre. Stars use size-mapped glyphs
    /// ('#' nearest ... '.' farthest); when two stars share a cell the nearer
    /// one wins. A legend with the distance range follows the plot.
    class ConsoleRenderer final : public Renderer
    {
    public:
        explicit ConsoleRenderer(std::ostream& out, ConsoleConfig config = {});

        [[nodiscard]] bool render(const Scene& scene) override;

        /// @brief Glyph for a normalized distance (0 = nearest).
        [[nodiscard]] static char distance_glyph(f64 normalized);

    private:
        /// @brief Draw a horizontal frame line.
        void hline(char c) const;

        std::ostream& m_out;
        ConsoleConfig m_config;
    };

} // namespace nearstars::rendering
