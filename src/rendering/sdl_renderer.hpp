#pragma once

/// @file sdl_renderer.hpp
/// @brief SDL2 scene drawing: static BMP image and live window outputs.

#include "core/window.hpp"
#include "rendering/renderer.hpp"
#include "rendering/text_painter.hpp"

#include <SDL2/SDL.h>

#include <filesystem>
#include <string_view>

namespace nearstars::rendering
{
    /// @brief Draws a Scene with an SDL_Renderer into a w x h pixel target.
    ///
    /// Layout: title and marker legend (observer, "Nearby Stars") in a header
    /// band; square plot area below it with a dotted grid, a frame and tick
    /// values at quarter intervals, labelled with the axis label on both axes;
    /// vertical colour bar on the right with d_min at the top (near) and d_max
    /// at the bottom. Stars are filled discs of radius 0.5 · sqrt(size) scaled
    /// with the plot, blended with the scene alpha.
    ///
    /// Text needs a valid TextPainter; without one the layout is unchanged and
    /// only the text is left out.
    class SceneCanvas
    {
    public:
        static constexpr int kTitleHeight = 32;     ///< Band holding the title
        static constexpr int kHeaderHeight = 64;    ///< Title + marker legend

        SceneCanvas(SDL_Renderer* renderer, int width, int height,
                    const TextPainter* text = nullptr);

        /// @brief Clear the target and draw @p scene.
        /// @return false if SDL reported a drawing error (cause is logged).
        [[nodiscard]] bool draw(const Scene& scene);

        /// @brief Plane coordinate -> pixel within the plot area.
        [[nodiscard]] SDL_Point to_pixel(f64 x, f64 y, f64 axis_bound) const;

        [[nodiscard]] const SDL_Rect& plot_area() const { return m_plot; }
        [[nodiscard]] const SDL_Rect& colorbar_area() const { return m_legend; }

    private:
        void draw_header(const Scene& scene);
        void draw_grid(const Scene& scene);
        void draw_observer(const ObserverMarker& observer, f64 axis_bound);
        void draw_legend(const Scene& scene);
        void draw_text(std::string_view text, int x, int y, TextAnchor anchor,
                       FontRole role = FontRole::Label, f64 angle_deg = 0.0);
        void fill_circle(int cx, int cy, int radius, Vec3f color, f32 alpha);
        void set_color(Vec3f color, f32 alpha);

        SDL_Renderer* m_renderer;
        const TextPainter* m_text;
        int m_width;
        SDL_Rect m_plot{};      ///< Square plot area
        SDL_Rect m_legend{};    ///< Colour bar area
        f64 m_marker_scale = 1.0;
        bool m_ok = true;
    };

    /// @brief Renders each scene to a BMP file through SDL's software renderer.
    ///
    /// Needs no display. Text is drawn with the TrueType font at @p font_path
    /// (empty or unreadable = no text).
    class ImageRenderer final : public Renderer
    {
    public:
        ImageRenderer(std::filesystem::path output, u32 width, u32 height,
                      const std::filesystem::path& font_path = {});

        [[nodiscard]] bool render(const Scene& scene) override;

    private:
        std::filesystem::path m_output;
        u32 m_width;
        u32 m_height;
        TextPainter m_text;
    };

    /// @brief Renders each scene into an SDL window; the title bar shows the scene title.
    ///
    /// The window is borrowed and must outlive the renderer.
    class WindowRenderer final : public Renderer
    {
    public:
        explicit WindowRenderer(core::Window& window, const std::filesystem::path& font_path = {});
        ~WindowRenderer() override;

        [[nodiscard]] bool render(const Scene& scene) override;

        /// @brief Fill the window with the background colour (no scene yet).
        void clear();

    private:
        core::Window& m_window;
        SDL_Renderer* m_renderer = nullptr;
        TextPainter m_text;
    };

} // namespace nearstars::rendering
