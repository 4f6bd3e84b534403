/// @file text_painter.cpp
/// @brief SDL2_ttf font ownership and text blitting.

#include "rendering/text_painter.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

namespace nearstars::rendering
{

namespace
{

struct SurfaceDeleter
{
    void operator()(SDL_Surface* s) const { SDL_FreeSurface(s); }
};

struct TextureDeleter
{
    void operator()(SDL_Texture* t) const { SDL_DestroyTexture(t); }
};

Uint8 to_byte(f32 c)
{
    return static_cast<Uint8>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f));
}

} // anonymous namespace

TextPainter::TextPainter(const std::filesystem::path& font_path)
{
    if (font_path.empty())
    {
        NST_CORE_DEBUG("TextPainter: no font configured, text is omitted");
        return;
    }

    // TTF_Init/TTF_Quit are reference counted
    if (TTF_Init() != 0)
    {
        NST_CORE_ERROR("TextPainter: TTF_Init failed: {}", TTF_GetError());
        return;
    }
    m_ttf_initialized = true;

    const std::string path = font_path.string();
    m_title_font = TTF_OpenFont(path.c_str(), kTitlePointSize);
    m_label_font = TTF_OpenFont(path.c_str(), kLabelPointSize);
    if (m_title_font == nullptr || m_label_font == nullptr)
    {
        NST_CORE_WARN("TextPainter: cannot open font {}: {}; text is omitted", path, TTF_GetError());
    }
}

TextPainter::~TextPainter()
{
    if (m_title_font != nullptr)
    {
        TTF_CloseFont(m_title_font);
    }
    if (m_label_font != nullptr)
    {
        TTF_CloseFont(m_label_font);
    }
    if (m_ttf_initialized)
    {
        TTF_Quit();
    }
}

bool TextPainter::is_valid() const
{
    return m_title_font != nullptr && m_label_font != nullptr;
}

bool TextPainter::draw(SDL_Renderer* renderer, std::string_view text,
                       int x, int y, TextAnchor anchor, Vec3f color,
                       FontRole role, f64 angle_deg) const
{
    if (!is_valid() || text.empty())
    {
        return true;
    }

    TTF_Font* font = role == FontRole::Title ? m_title_font : m_label_font;
    const SDL_Color fg{to_byte(color.r), to_byte(color.g), to_byte(color.b), 255};

    const std::string utf8(text);
    std::unique_ptr<SDL_Surface, SurfaceDeleter> surface(TTF_RenderUTF8_Blended(font, utf8.c_str(), fg));
    if (!surface)
    {
        NST_CORE_ERROR("TextPainter: cannot render \"{}\": {}", utf8, TTF_GetError());
        return false;
    }

    std::unique_ptr<SDL_Texture, TextureDeleter> texture(SDL_CreateTextureFromSurface(renderer, surface.get()));
    if (!texture)
    {
        NST_CORE_ERROR("TextPainter: SDL_CreateTextureFromSurface failed: {}", SDL_GetError());
        return false;
    }

    // -----------------------------------------------------------------
    // Anchor -> top-left of the unrotated box; rotation is about its centre
    // -----------------------------------------------------------------
    const int w = surface->w;
    const int h = surface->h;
    SDL_Rect dst{x, y, w, h};
    switch (anchor)
    {
        case TextAnchor::TopLeft:                                          break;
        case TextAnchor::TopCentre:   dst.x = x - w / 2;                   break;
        case TextAnchor::MiddleLeft:  dst.y = y - h / 2;                   break;
        case TextAnchor::MiddleRight: dst.x = x - w;     dst.y = y - h / 2; break;
        case TextAnchor::Centre:      dst.x = x - w / 2; dst.y = y - h / 2; break;
    }

    if (SDL_RenderCopyEx(renderer, texture.get(), nullptr, &dst, angle_deg, nullptr, SDL_FLIP_NONE) != 0)
    {
        NST_CORE_ERROR("TextPainter: SDL_RenderCopyEx failed: {}", SDL_GetError());
        return false;
    }
    return true;
}

} // namespace nearstars::rendering
