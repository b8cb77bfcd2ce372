#include "cli_common.hpp"
#include <mesh/page_mesh.hpp>
#include <serialization/mesh_json.hpp>

namespace pagecurl::cli {

namespace {

void print_mesh_usage() {
    std::cerr << "Usage: pagecurl mesh [--rect l,t,r,b] [--pos x,y] [--dir x,y] [--radius r]\n"
              << "                     [-c config.json] [-o out.json|out.obj] [-v]\n";
}

}  // namespace

int command_mesh(int argc, char** argv) {
    auto log = pagecurl::logging::get_logger();

    try {
        CommandContext ctx;
        RectF rect{-1.0f, 1.0f, 1.0f, -1.0f};
        Vec2 position{0.0f, 0.0f};
        Vec2 direction{1.0f, 0.0f};
        float radius = 0.25f;

        int i = 2;
        while (i < argc) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_mesh_usage();
                return 0;
            } else if (arg == "--rect") {
                auto v = parse_float_list(option_value(argc, argv, i), 4, arg);
                rect = RectF{v[0], v[1], v[2], v[3]};
                i += 2;
            } else if (arg == "--pos") {
                auto v = parse_float_list(option_value(argc, argv, i), 2, arg);
                position = Vec2{v[0], v[1]};
                i += 2;
            } else if (arg == "--dir") {
                auto v = parse_float_list(option_value(argc, argv, i), 2, arg);
                direction = Vec2{v[0], v[1]};
                i += 2;
            } else if (arg == "--radius") {
                radius = parse_float_list(option_value(argc, argv, i), 1, arg)[0];
                i += 2;
            } else {
                int next = parse_common_arg(ctx, argc, argv, i);
                if (next == i) {
                    print_mesh_usage();
                    throw std::runtime_error("Unknown option: " + arg);
                }
                i = next;
            }
        }

        apply_verbosity(ctx);

        if (direction.length() == 0.0f) {
            throw std::runtime_error("--dir must not be a zero vector");
        }
        if (radius < 0.0f) {
            throw std::runtime_error("--radius must not be negative");
        }
        direction = direction.normalized();

        ControllerConfig config = load_controller_config(ctx);

        log->info("Curling rect [{}, {}, {}, {}] at ({}, {}) dir ({}, {}) radius {}",
                  rect.left, rect.top, rect.right, rect.bottom,
                  position.x, position.y, direction.x, direction.y, radius);

        PageMesh mesh(config.mesh);
        mesh.set_rect(rect);
        mesh.curl(position, direction, radius);

        log->debug("front={} back={} drop_shadow={} self_shadow={} degenerate={}",
                   mesh.front_count(), mesh.back_count(),
                   mesh.drop_shadow_count(), mesh.self_shadow_count(),
                   mesh.degenerate_clip_count());

        if (ctx.output_path.empty()) {
            std::cout << page_mesh_to_json(mesh).dump(2) << "\n";
            return 0;
        }

        if (ends_with(ctx.output_path, ".obj")) {
            write_file(ctx.output_path, mesh.to_obj());
        } else {
            json::SerializedData data;
            data.step = "page_mesh";
            data.timestamp = json::get_timestamp();
            data.config = config;
            data.config["curl"] = {
                {"rect", rect},
                {"position", position},
                {"direction", direction},
                {"radius", radius}
            };
            data.data = page_mesh_to_json(mesh);
            data.stats = {
                {"front_count", mesh.front_count()},
                {"back_count", mesh.back_count()},
                {"drop_shadow_count", mesh.drop_shadow_count()},
                {"self_shadow_count", mesh.self_shadow_count()}
            };
            json::write_serialized(ctx.output_path, data);
        }

        log->info("Wrote mesh to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << mesh.front_count() << " front, "
                  << mesh.back_count() << " back vertices)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pagecurl::cli
