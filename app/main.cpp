#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Page curl geometry and interactive page viewer.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  mesh        Curl a single page and write its geometry (.json or .obj)\n";
    std::cerr << "  view        Open the interactive viewer with generated pages\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c <file>   Controller configuration (JSON)\n";
    std::cerr << "  -o <file>   Output file\n";
    std::cerr << "  -v          Verbose logging\n";
    std::cerr << "  --help      Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  PAGECURL_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = pagecurl::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    log->debug("Running command '{}'", command);

    if (command == "mesh") {
        return pagecurl::cli::command_mesh(argc, argv);
    } else if (command == "view") {
        return pagecurl::cli::command_view(argc, argv);
    }

    log->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
