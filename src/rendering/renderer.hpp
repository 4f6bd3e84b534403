#pragma once

/// @file renderer.hpp
/// @brief Renderer interface: a sink that draws one complete Scene per call.

#include "rendering/scene.hpp"

namespace nearstars::rendering
{
    /// @brief Abstract drawing sink.
    ///
    /// Implementations keep no reference to the scene after render() returns;
    /// each call replaces whatever the previous one produced.
    class Renderer
    {
    public:
        Renderer() = default;
        virtual ~Renderer() = default;

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;
        Renderer(Renderer&&) = delete;
        Renderer& operator=(Renderer&&) = delete;

        /// @brief Draw @p scene.
        /// @return false if the artifact could not be produced (cause is logged).
        [[nodiscard]] virtual bool render(const Scene& scene) = 0;
    };

} // namespace nearstars::rendering
