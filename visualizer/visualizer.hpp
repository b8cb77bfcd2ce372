#ifndef PAGECURL_VISUALIZER_HPP
#define PAGECURL_VISUALIZER_HPP

#include <controller/curl_controller.hpp>
#include <geometry/color.hpp>
#include <layout/page_layout.hpp>
#include <string>

namespace pagecurl {

// Configuration for the visualizer
struct VisualizerConfig {
    int window_width = 1024;
    int window_height = 768;
    std::string window_title = "PageCurl";

    int page_count = 10;                   // Pages served by the demo provider
    LayoutMargins margins{0.05f, 0.05f, 0.05f, 0.05f};
    Argb background_color = color::rgb(0x30, 0x30, 0x30);

    float tap_slop_pixels = 6.0f;          // Movement below this is a tap, not a drag
};

// Result of visualization session
struct VisualizerResult {
    bool completed = false;           // User closed window normally
    int final_index = 0;              // Current page index when the window closed
    int page_turns = 0;               // Index changes observed
};

// Interactive page viewer: drag pages to curl them, arrow keys jump pages.
// Returns when the window is closed.
VisualizerResult visualize_pages(
    const ControllerConfig& controller_config,
    const VisualizerConfig& viz_config = VisualizerConfig{}
);

// Check if visualization is available (GLFW/OpenGL compiled in)
bool visualization_available();

}  // namespace pagecurl

#endif // PAGECURL_VISUALIZER_HPP
