#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>

namespace pagecurl::cli {

namespace {

void print_view_usage() {
    std::cerr << "Usage: pagecurl view [--pages N] [--two-pages] [-c config.json] [-v]\n";
}

}  // namespace

int command_view(int argc, char** argv) {
    auto log = pagecurl::logging::get_logger();

    try {
        CommandContext ctx;
        VisualizerConfig viz_config;
        bool two_pages = false;

        int i = 2;
        while (i < argc) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_view_usage();
                return 0;
            } else if (arg == "--pages") {
                viz_config.page_count = parse_int(option_value(argc, argv, i), arg);
                if (viz_config.page_count < 0) {
                    throw std::runtime_error("--pages must not be negative");
                }
                i += 2;
            } else if (arg == "--two-pages") {
                two_pages = true;
                ++i;
            } else {
                int next = parse_common_arg(ctx, argc, argv, i);
                if (next == i) {
                    print_view_usage();
                    throw std::runtime_error("Unknown option: " + arg);
                }
                i = next;
            }
        }

        apply_verbosity(ctx);

        if (!visualization_available()) {
            log->error("Visualization not available - recompile with GLFW and OpenGL");
            std::cerr << "Error: Visualization not available\n";
            return 1;
        }

        ControllerConfig config = load_controller_config(ctx);
        if (two_pages) {
            config.view_mode = ViewMode::TwoPages;
        }

        log->info("Starting viewer with {} pages", viz_config.page_count);
        VisualizerResult result = visualize_pages(config, viz_config);

        if (!result.completed) {
            return 1;
        }
        std::cerr << "Closed at page " << result.final_index << " ("
                  << result.page_turns << " page changes)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pagecurl::cli
