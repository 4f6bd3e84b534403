/// @file console_renderer.cpp
/// @brief ASCII scatter plot of a scene.

#include "rendering/console_renderer.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <string>
#include <vector>

namespace nearstars::rendering
{

namespace
{

constexpr char kObserverGlyph = '@';

// Glyph rank: higher value = nearer star, wins a shared cell
int glyph_rank(char g)
{
    switch (g)
    {
        case '#': return 5;
        case '*': return 4;
        case 'o': return 3;
        case '+': return 2;
        case '.': return 1;
        default:  return 0;
    }
}

struct Cell
{
    char glyph = ' ';
    Vec3f color{1.0f, 1.0f, 1.0f};
};

} // anonymous namespace

ConsoleRenderer::ConsoleRenderer(std::ostream& out, ConsoleConfig config)
    : m_out{out}
    , m_config{config}
{
}

// -----------------------------------------------------------------
// Glyph table: # * o + .  (index 0 = nearest)
// -----------------------------------------------------------------

char ConsoleRenderer::distance_glyph(f64 normalized)
{
    if (normalized < 0.2) return '#';
    if (normalized < 0.4) return '*';
    if (normalized < 0.6) return 'o';
    if (normalized < 0.8) return '+';
    return '.';
}

void ConsoleRenderer::hline(char c) const
{
    m_out << '+' << std::string(m_config.width - 2, c) << '+' << '\n';
}

// -----------------------------------------------------------------
// render
//
// Plane -> grid:
//   col = (x + b) / 2b × (cols - 1)
//   row = (b - y) / 2b × (rows - 1)     (north up)
// -----------------------------------------------------------------

bool ConsoleRenderer::render(const Scene& scene)
{
    if (m_config.width < 12 || m_config.height < 3 || scene.axis_bound <= 0.0)
    {
        NST_CORE_ERROR("ConsoleRenderer: viewport {}x{} or axis bound {} unusable",
                       m_config.width, m_config.height, scene.axis_bound);
        return false;
    }

    const auto cols = static_cast<int>(m_config.width - 2);
    const auto rows = static_cast<int>(m_config.height);
    const f64 b = scene.axis_bound;

    std::vector<std::vector<Cell>> grid(
        static_cast<std::size_t>(rows),
        std::vector<Cell>(static_cast<std::size_t>(cols)));

    auto to_cell = [&](f64 x, f64 y, int& col, int& row) {
        col = static_cast<int>(std::lround((x + b) / (2.0 * b) * (cols - 1)));
        row = static_cast<int>(std::lround((b - y) / (2.0 * b) * (rows - 1)));
        return col >= 0 && col < cols && row >= 0 && row < rows;
    };

    const Colormap colormap(scene.colormap);
    std::size_t clipped = 0;

    for (const auto& star : scene.stars)
    {
        int col = 0;
        int row = 0;
        if (!to_cell(star.point.x, star.point.y, col, row))
        {
            ++clipped;
            continue;
        }

        auto& cell = grid[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)];
        const char g = distance_glyph(star.normalized);
        if (glyph_rank(g) > glyph_rank(cell.glyph))
        {
            cell.glyph = g;
            cell.color = colormap.sample(star.color);
        }
    }

    // Observer drawn last, always on top
    {
        int col = 0;
        int row = 0;
        if (to_cell(0.0, 0.0, col, row))
        {
            auto& cell = grid[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)];
            cell.glyph = kObserverGlyph;
            cell.color = scene.observer.core_color;
        }
    }

    // -----------------------------------------------------------------
    // Emit
    // -----------------------------------------------------------------
    const int inner = static_cast<int>(m_config.width) - 4;

    hline('=');
    m_out << "| " << std::left << std::setw(inner) << scene.title.substr(0, static_cast<std::size_t>(inner))
          << " |" << '\n';
    hline('-');

    for (const auto& line : grid)
    {
        m_out << '|';
        for (const auto& cell : line)
        {
            if (m_config.ansi_color && cell.glyph != ' ')
            {
                m_out << fmt::format("\x1b[38;2;{};{};{}m{}\x1b[0m",
                                     static_cast<int>(cell.color.r * 255.0f),
                                     static_cast<int>(cell.color.g * 255.0f),
                                     static_cast<int>(cell.color.b * 255.0f),
                                     cell.glyph);
            }
            else
            {
                m_out << cell.glyph;
            }
        }
        m_out << '|' << '\n';
    }

    hline('-');

    auto row = [&](const std::string& lbl, const std::string& val) {
        m_out << "| " << std::left << std::setw(16) << lbl
              << " : " << std::left << std::setw(std::max(inner - 19, 0)) << val
              << " |\n";
    };

    row("Axes", fmt::format("{} [-{:.2f}, {:.2f}]", scene.axis_label, b, b));
    row("Observer", fmt::format("{} {}", kObserverGlyph, scene.observer.label));
    row("Stars", fmt::format("{} plotted, {} outside the axes", scene.stars.size() - clipped, clipped));
    row("Legend", fmt::format("# {:.2f} pc (near) .. . {:.2f} pc (far)",
                              scene.legend.min_pc, scene.legend.max_pc));
    hline('=');

    m_out.flush();
    return static_cast<bool>(m_out);
}

} // namespace nearstars::rendering
