/// @file sdl_renderer.cpp
/// @brief SDL2 drawing of scenes to images and windows.

#include "rendering/sdl_renderer.hpp"

#include "core/logger.hpp"
#include "rendering/colormap.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nearstars::rendering
{

namespace
{

constexpr int kMarginLeft = 80;         ///< Y tick values + rotated axis label
constexpr int kMarginRight = 16;
constexpr int kFooterHeight = 52;       ///< X tick values + axis label
constexpr int kLegendWidth = 24;
constexpr int kLegendGap = 24;
constexpr int kLegendLabelWidth = 76;   ///< "123.45 pc"
constexpr int kTickLength = 6;
constexpr int kLabelGap = 4;
constexpr int kTitleTop = 8;
constexpr int kKeyRadius = 6;           ///< Marker legend discs
constexpr int kKeySpacing = 120;
constexpr int kGridDivisions = 8;
constexpr int kGridDotSpacing = 4;
constexpr f64 kReferencePlotSize = 720.0;   ///< Plot size at which marker sizes are 1:1

constexpr const char* kStarsLabel = "Nearby Stars";

const Vec3f kBackground{0.0f, 0.0f, 0.0f};
const Vec3f kForeground{1.0f, 1.0f, 1.0f};
const Vec3f kGridColor{0.5f, 0.5f, 0.5f};

u8 to_byte(f32 c)
{
    return static_cast<u8>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f));
}

struct SurfaceDeleter
{
    void operator()(SDL_Surface* s) const { SDL_FreeSurface(s); }
};

struct RendererDeleter
{
    void operator()(SDL_Renderer* r) const { SDL_DestroyRenderer(r); }
};

} // anonymous namespace

// =================================================================
// SceneCanvas
// =================================================================

SceneCanvas::SceneCanvas(SDL_Renderer* renderer, int width, int height, const TextPainter* text)
    : m_renderer{renderer}
    , m_text{text}
    , m_width{width}
{
    const int avail_w = width - kMarginLeft - kLegendGap - kLegendWidth - kLegendLabelWidth - kMarginRight;
    const int avail_h = height - kHeaderHeight - kFooterHeight;
    const int plot_size = std::max(std::min(avail_w, avail_h), 16);

    m_plot = SDL_Rect{kMarginLeft, kHeaderHeight + std::max(avail_h - plot_size, 0) / 2, plot_size, plot_size};
    m_legend = SDL_Rect{m_plot.x + plot_size + kLegendGap, m_plot.y, kLegendWidth, plot_size};
    m_marker_scale = static_cast<f64>(plot_size) / kReferencePlotSize;
}

SDL_Point SceneCanvas::to_pixel(f64 x, f64 y, f64 axis_bound) const
{
    const f64 span = 2.0 * axis_bound;
    return SDL_Point{
        m_plot.x + static_cast<int>(std::lround((x + axis_bound) / span * (m_plot.w - 1))),
        m_plot.y + static_cast<int>(std::lround((axis_bound - y) / span * (m_plot.h - 1))),
    };
}

void SceneCanvas::set_color(Vec3f color, f32 alpha)
{
    if (SDL_SetRenderDrawColor(m_renderer, to_byte(color.r), to_byte(color.g),
                               to_byte(color.b), to_byte(alpha)) != 0)
    {
        m_ok = false;
    }
}

void SceneCanvas::draw_text(std::string_view text, int x, int y, TextAnchor anchor,
                            FontRole role, f64 angle_deg)
{
    if (m_text != nullptr && !m_text->draw(m_renderer, text, x, y, anchor, kForeground, role, angle_deg))
    {
        m_ok = false;
    }
}

// Scanline fill; SDL2 has no circle primitive
void SceneCanvas::fill_circle(int cx, int cy, int radius, Vec3f color, f32 alpha)
{
    set_color(color, alpha);
    for (int dy = -radius; dy <= radius; ++dy)
    {
        const auto half = static_cast<int>(std::sqrt(static_cast<f64>(radius * radius - dy * dy)));
        if (SDL_RenderDrawLine(m_renderer, cx - half, cy + dy, cx + half, cy + dy) != 0)
        {
            m_ok = false;
        }
    }
}

// Title, then one key entry per marker kind
void SceneCanvas::draw_header(const Scene& scene)
{
    draw_text(scene.title, m_width / 2, kTitleTop, TextAnchor::TopCentre, FontRole::Title);

    const int cy = kTitleHeight + (kHeaderHeight - kTitleHeight) / 2;
    int x = m_plot.x + kKeyRadius;

    const ObserverMarker& observer = scene.observer;
    fill_circle(x, cy, static_cast<int>(std::lround(kKeyRadius * observer.glow_scale)),
                observer.glow_color, observer.glow_alpha);
    fill_circle(x, cy, kKeyRadius, observer.core_color, 1.0f);
    draw_text(observer.label, x + 2 * kKeyRadius, cy, TextAnchor::MiddleLeft);

    x += kKeySpacing;
    fill_circle(x, cy, kKeyRadius, Colormap(scene.colormap).sample(0.5), scene.star_alpha);
    draw_text(kStarsLabel, x + 2 * kKeyRadius, cy, TextAnchor::MiddleLeft);
}

void SceneCanvas::draw_grid(const Scene& scene)
{
    const f64 axis_bound = scene.axis_bound;

    // Dotted grid
    set_color(kGridColor, 0.5f);
    for (int i = 0; i <= kGridDivisions; ++i)
    {
        const int px = m_plot.x + i * (m_plot.w - 1) / kGridDivisions;
        const int py = m_plot.y + i * (m_plot.h - 1) / kGridDivisions;
        for (int t = 0; t < m_plot.w; t += kGridDotSpacing)
        {
            SDL_RenderDrawPoint(m_renderer, px, m_plot.y + t);
            SDL_RenderDrawPoint(m_renderer, m_plot.x + t, py);
        }
    }

    // Frame, ticks and tick values
    set_color(kForeground, 1.0f);
    if (SDL_RenderDrawRect(m_renderer, &m_plot) != 0)
    {
        m_ok = false;
    }

    for (int i = 0; i <= 4; ++i)
    {
        const f64 v = -axis_bound + i * axis_bound / 2.0;
        const SDL_Point bottom = to_pixel(v, -axis_bound, axis_bound);
        const SDL_Point left = to_pixel(-axis_bound, v, axis_bound);
        set_color(kForeground, 1.0f);
        SDL_RenderDrawLine(m_renderer, bottom.x, bottom.y, bottom.x, bottom.y + kTickLength);
        SDL_RenderDrawLine(m_renderer, left.x - kTickLength, left.y, left.x, left.y);

        const std::string value = fmt::format("{:.2f}", v);
        draw_text(value, bottom.x, bottom.y + kTickLength + kLabelGap, TextAnchor::TopCentre);
        draw_text(value, left.x - kTickLength - kLabelGap, left.y, TextAnchor::MiddleRight);
    }

    draw_text(scene.axis_label, m_plot.x + m_plot.w / 2, m_plot.y + m_plot.h + kFooterHeight - 20,
              TextAnchor::TopCentre);
    draw_text(scene.axis_label, kLabelGap + 10, m_plot.y + m_plot.h / 2, TextAnchor::Centre,
              FontRole::Label, -90.0);
}

void SceneCanvas::draw_observer(const ObserverMarker& observer, f64 axis_bound)
{
    const SDL_Point c = to_pixel(0.0, 0.0, axis_bound);
    const f64 core = std::max(1.0, 0.5 * std::sqrt(observer.size) * m_marker_scale);

    fill_circle(c.x, c.y, static_cast<int>(std::lround(core * observer.glow_scale)),
                observer.glow_color, observer.glow_alpha);
    fill_circle(c.x, c.y, static_cast<int>(std::lround(core)), observer.core_color, 1.0f);
}

// Vertical colour bar: top = nearest (d_min, colour value 1), bottom = farthest (d_max)
void SceneCanvas::draw_legend(const Scene& scene)
{
    const Colormap colormap(scene.colormap);
    for (int row = 0; row < m_legend.h; ++row)
    {
        const f64 t = 1.0 - static_cast<f64>(row) / std::max(m_legend.h - 1, 1);
        set_color(colormap.sample(t), 1.0f);
        SDL_RenderDrawLine(m_renderer, m_legend.x, m_legend.y + row,
                           m_legend.x + m_legend.w - 1, m_legend.y + row);
    }

    set_color(kForeground, 1.0f);
    SDL_RenderDrawRect(m_renderer, &m_legend);

    const f64 span = scene.legend.max_pc - scene.legend.min_pc;
    for (int i = 0; i <= 4; ++i)
    {
        const int y = m_legend.y + i * (m_legend.h - 1) / 4;
        set_color(kForeground, 1.0f);
        SDL_RenderDrawLine(m_renderer, m_legend.x + m_legend.w, y,
                           m_legend.x + m_legend.w + kTickLength, y);

        const f64 distance = scene.legend.min_pc + span * i / 4.0;
        draw_text(fmt::format("{:.2f} pc", distance),
                  m_legend.x + m_legend.w + kTickLength + kLabelGap, y, TextAnchor::MiddleLeft);
    }
}

bool SceneCanvas::draw(const Scene& scene)
{
    m_ok = true;

    if (scene.axis_bound <= 0.0 || !std::isfinite(scene.axis_bound))
    {
        NST_CORE_ERROR("SceneCanvas: axis bound {} unusable", scene.axis_bound);
        return false;
    }

    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);
    set_color(kBackground, 1.0f);
    if (SDL_RenderClear(m_renderer) != 0)
    {
        NST_CORE_ERROR("SceneCanvas: SDL_RenderClear failed: {}", SDL_GetError());
        return false;
    }

    draw_header(scene);
    draw_grid(scene);

    // Far stars first so near (larger) discs end on top
    std::vector<const VisualPoint*> order;
    order.reserve(scene.stars.size());
    for (const auto& star : scene.stars)
    {
        order.push_back(&star);
    }
    std::stable_sort(order.begin(), order.end(), [](const VisualPoint* a, const VisualPoint* b) {
        return a->point.distance_pc > b->point.distance_pc;
    });

    const Colormap colormap(scene.colormap);
    SDL_RenderSetClipRect(m_renderer, &m_plot);
    for (const VisualPoint* star : order)
    {
        const SDL_Point p = to_pixel(star->point.x, star->point.y, scene.axis_bound);
        const f64 radius = std::max(1.0, 0.5 * std::sqrt(star->size) * m_marker_scale);
        fill_circle(p.x, p.y, static_cast<int>(std::lround(radius)),
                    colormap.sample(star->color), scene.star_alpha);
    }
    draw_observer(scene.observer, scene.axis_bound);
    SDL_RenderSetClipRect(m_renderer, nullptr);

    draw_legend(scene);

    if (!m_ok)
    {
        NST_CORE_ERROR("SceneCanvas: drawing failed: {}", SDL_GetError());
    }
    return m_ok;
}

// =================================================================
// ImageRenderer
// =================================================================

ImageRenderer::ImageRenderer(std::filesystem::path output, u32 width, u32 height,
                             const std::filesystem::path& font_path)
    : m_output{std::move(output)}
    , m_width{width}
    , m_height{height}
    , m_text{font_path}
{
}

bool ImageRenderer::render(const Scene& scene)
{
    std::unique_ptr<SDL_Surface, SurfaceDeleter> surface(SDL_CreateRGBSurfaceWithFormat(
        0, static_cast<int>(m_width), static_cast<int>(m_height), 32, SDL_PIXELFORMAT_RGBA32));
    if (!surface)
    {
        NST_CORE_ERROR("ImageRenderer: SDL_CreateRGBSurfaceWithFormat failed: {}", SDL_GetError());
        return false;
    }

    std::unique_ptr<SDL_Renderer, RendererDeleter> renderer(SDL_CreateSoftwareRenderer(surface.get()));
    if (!renderer)
    {
        NST_CORE_ERROR("ImageRenderer: SDL_CreateSoftwareRenderer failed: {}", SDL_GetError());
        return false;
    }

    SceneCanvas canvas(renderer.get(), static_cast<int>(m_width), static_cast<int>(m_height), &m_text);
    if (!canvas.draw(scene))
    {
        return false;
    }
    SDL_RenderPresent(renderer.get());

    if (SDL_SaveBMP(surface.get(), m_output.string().c_str()) != 0)
    {
        NST_CORE_ERROR("ImageRenderer: cannot write {}: {}", m_output.string(), SDL_GetError());
        return false;
    }

    NST_CORE_INFO("ImageRenderer: wrote \"{}\" ({}x{}) to {}",
                  scene.title, m_width, m_height, m_output.string());
    return true;
}

// =================================================================
// WindowRenderer
// =================================================================

WindowRenderer::WindowRenderer(core::Window& window, const std::filesystem::path& font_path)
    : m_window{window}
    , m_text{font_path}
{
    if (!window.is_valid())
    {
        NST_CORE_ERROR("WindowRenderer: window is not valid");
        return;
    }

    m_renderer = SDL_CreateRenderer(window.get_native_handle(), -1, 0);
    if (m_renderer == nullptr)
    {
        NST_CORE_ERROR("WindowRenderer: SDL_CreateRenderer failed: {}", SDL_GetError());
    }
}

WindowRenderer::~WindowRenderer()
{
    if (m_renderer != nullptr)
    {
        SDL_DestroyRenderer(m_renderer);
    }
}

void WindowRenderer::clear()
{
    if (m_renderer == nullptr)
    {
        return;
    }
    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
    SDL_RenderClear(m_renderer);
    SDL_RenderPresent(m_renderer);
}

bool WindowRenderer::render(const Scene& scene)
{
    if (m_renderer == nullptr)
    {
        return false;
    }

    int w = 0;
    int h = 0;
    if (SDL_GetRendererOutputSize(m_renderer, &w, &h) != 0)
    {
        NST_CORE_ERROR("WindowRenderer: SDL_GetRendererOutputSize failed: {}", SDL_GetError());
        return false;
    }

    SceneCanvas canvas(m_renderer, w, h, &m_text);
    if (!canvas.draw(scene))
    {
        return false;
    }
    SDL_RenderPresent(m_renderer);

    m_window.set_title(scene.title);
    return true;
}

} // namespace nearstars::rendering
