#ifndef PAGECURL_CLI_COMMON_HPP
#define PAGECURL_CLI_COMMON_HPP

#include <controller/curl_controller.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pagecurl::cli {

// Options shared by all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
};

// Consume one common option at argv[i]. Returns the index of the next
// argument, or i unchanged when argv[i] is not a common option.
inline int parse_common_arg(CommandContext& ctx, int argc, char** argv, int i) {
    std::string arg = argv[i];

    if (arg == "-v" || arg == "--verbose") {
        ctx.verbose = true;
        return i + 1;
    } else if (arg == "-o" || arg == "--output") {
        if (i + 1 >= argc) {
            throw std::runtime_error("-o/--output requires an argument");
        }
        ctx.output_path = argv[i + 1];
        return i + 2;
    } else if (arg == "-c" || arg == "--config") {
        if (i + 1 >= argc) {
            throw std::runtime_error("-c/--config requires an argument");
        }
        ctx.config_path = argv[i + 1];
        return i + 2;
    }
    return i;
}

// Value following the option at argv[i]
inline std::string option_value(int argc, char** argv, int i) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(argv[i]) + " requires an argument");
    }
    return argv[i + 1];
}

// Parse "a,b,..." into exactly `count` floats
inline std::vector<float> parse_float_list(const std::string& text, size_t count,
                                           const std::string& option) {
    std::vector<float> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t used = 0;
        float value = 0.0f;
        try {
            value = std::stof(item, &used);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number '" + item + "' for " + option);
        }
        if (used != item.size()) {
            throw std::runtime_error("Invalid number '" + item + "' for " + option);
        }
        values.push_back(value);
    }
    if (values.size() != count) {
        throw std::runtime_error(option + " expects " + std::to_string(count) +
                                 " comma separated numbers");
    }
    return values;
}

inline int parse_int(const std::string& text, const std::string& option) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer '" + text + "' for " + option);
    }
    if (used != text.size()) {
        throw std::runtime_error("Invalid integer '" + text + "' for " + option);
    }
    return value;
}

// Controller configuration from -c, defaults otherwise
inline ControllerConfig load_controller_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return ControllerConfig{};
    }
    auto log = pagecurl::logging::get_logger();
    log->info("Loading configuration from {}", *ctx.config_path);
    nlohmann::json j = json::extract_config(json::read_json_file(*ctx.config_path));
    try {
        return j.get<ControllerConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid configuration in " + *ctx.config_path + ": " + e.what());
    }
}

inline void apply_verbosity(const CommandContext& ctx) {
    if (ctx.verbose && !pagecurl::logging::level_from_environment()) {
        pagecurl::logging::get_logger()->set_level(spdlog::level::debug);
    }
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Command function declarations
int command_mesh(int argc, char** argv);
int command_view(int argc, char** argv);

}  // namespace pagecurl::cli

#endif // PAGECURL_CLI_COMMON_HPP
