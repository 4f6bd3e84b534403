#pragma once

/// @file interactive_app.hpp
/// @brief Event-driven front end: type a distance, press Enter, see the plot.

#include "core/input.hpp"
#include "core/window.hpp"
#include "pipeline/pipeline.hpp"
#include "rendering/sdl_renderer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace nearstars::app
{
    /// @brief Owns the window, input and window renderer; drives the pipeline per Enter press.
    ///
    /// Lifecycle: init() in constructor → run() drives main_loop() → shutdown() in destructor.
    /// Each submission runs one full pipeline before further events are read.
    /// The last successful scene is kept only to repaint after expose/resize.
    class InteractiveApp
    {
    public:
        /// @param runner Borrowed; must outlive the app.
        /// @param unit Unit the typed value is interpreted in.
        /// @param font_path TrueType font for plot text (empty = none).
        InteractiveApp(pipeline::Pipeline& runner, std::string unit,
                       std::filesystem::path font_path = {},
                       const core::WindowConfig& window_config = {});

        ~InteractiveApp();

        InteractiveApp(const InteractiveApp&) = delete;
        InteractiveApp& operator=(const InteractiveApp&) = delete;
        InteractiveApp(InteractiveApp&&) = delete;
        InteractiveApp& operator=(InteractiveApp&&) = delete;

        /// @brief Enter the event loop. Returns when the window is closed.
        /// @return false if the window could not be created.
        [[nodiscard]] bool run();

    private:
        void init(const core::WindowConfig& window_config);
        void main_loop();
        void shutdown();

        void submit();
        void refresh_title();

        static constexpr int kEventWaitMs = 100;

        pipeline::Pipeline& m_pipeline;
        std::string m_unit;
        std::filesystem::path m_font_path;

        std::unique_ptr<core::Window> m_window;
        std::unique_ptr<core::Input> m_input;
        std::unique_ptr<rendering::WindowRenderer> m_renderer;

        std::optional<rendering::Scene> m_scene;    ///< Last drawn scene
        std::string m_status;                       ///< Last outcome message
    };

} // namespace nearstars::app
