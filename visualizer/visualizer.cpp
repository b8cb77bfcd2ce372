#include "visualizer.hpp"
#include "logging.hpp"
#include <controller/demo_page_provider.hpp>

#ifdef PAGECURL_HAS_VISUALIZATION

#include <GLFW/glfw3.h>
#include <array>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace pagecurl {

// Draws page meshes with fixed-function client arrays. Keeps two textures
// (front, back) per mesh id.
class MeshRenderer {
public:
    ~MeshRenderer() { release(); }

    void draw(PageMesh& mesh);

    // Delete textures of meshes the controller no longer owns
    void prune(const CurlController& controller);

    // Drop all textures, e.g. before the context goes away
    void release();

private:
    struct MeshTextures {
        std::array<GLuint, 2> ids{0, 0};
        bool created = false;
    };

    static void upload_image(const Image& image);

    std::unordered_map<uint64_t, MeshTextures> textures_;
};

void MeshRenderer::upload_image(const Image& image) {
    std::vector<unsigned char> rgba(static_cast<size_t>(image.width) * image.height * 4);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        Argb c = image.pixels[i];
        rgba[i * 4 + 0] = static_cast<unsigned char>(color::red(c));
        rgba[i * 4 + 1] = static_cast<unsigned char>(color::green(c));
        rgba[i * 4 + 2] = static_cast<unsigned char>(color::blue(c));
        rgba[i * 4 + 3] = static_cast<unsigned char>(color::alpha(c));
    }
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, image.width, image.height, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());
}

void MeshRenderer::release() {
    for (auto& [id, tex] : textures_) {
        if (tex.created) {
            glDeleteTextures(2, tex.ids.data());
        }
    }
    textures_.clear();
}

void MeshRenderer::prune(const CurlController& controller) {
    for (auto it = textures_.begin(); it != textures_.end();) {
        if (controller.owns_mesh(it->first)) {
            ++it;
            continue;
        }
        if (it->second.created) {
            glDeleteTextures(2, it->second.ids.data());
        }
        it = textures_.erase(it);
    }
}

void MeshRenderer::draw(PageMesh& mesh) {
    const MeshConfig& config = mesh.config();
    MeshTextures& tex = textures_[mesh.id()];

    if (config.draw_texture && !tex.created) {
        glGenTextures(2, tex.ids.data());
        for (GLuint id : tex.ids) {
            glBindTexture(GL_TEXTURE_2D, id);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        }
        tex.created = true;
    }

    if (auto upload = mesh.take_texture_upload()) {
        if (upload->front) {
            glBindTexture(GL_TEXTURE_2D, tex.ids[0]);
            upload_image(*upload->front);
        }
        if (upload->back) {
            glBindTexture(GL_TEXTURE_2D, tex.ids[1]);
            upload_image(*upload->back);
        }
    }

    bool back_texture = mesh.has_back_texture();
    bool flip = mesh.flip_texture();
    int front_count = mesh.front_count();
    int back_start = mesh.back_strip_start();
    int back_count = mesh.back_strip_count();

    glEnableClientState(GL_VERTEX_ARRAY);

    // Drop shadow goes underneath everything else
    if (config.draw_shadow) {
        glDisable(GL_TEXTURE_2D);
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glEnableClientState(GL_COLOR_ARRAY);
        glColorPointer(4, GL_FLOAT, 0, mesh.shadow_colors().data());
        glVertexPointer(3, GL_FLOAT, 0, mesh.shadow_vertices().data());
        glDrawArrays(GL_TRIANGLE_STRIP, 0, mesh.drop_shadow_count());
        glDisableClientState(GL_COLOR_ARRAY);
        glDisable(GL_BLEND);
    }

    if (config.draw_texture) {
        glEnableClientState(GL_TEXTURE_COORD_ARRAY);
        glTexCoordPointer(2, GL_FLOAT, 0, mesh.tex_coords().data());
    }
    glVertexPointer(3, GL_FLOAT, 0, mesh.vertices().data());
    glEnableClientState(GL_COLOR_ARRAY);
    glColorPointer(4, GL_FLOAT, 0, mesh.colors().data());

    // Front: blank then textured
    glDisable(GL_TEXTURE_2D);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, front_count);
    if (config.draw_texture) {
        glEnable(GL_BLEND);
        glEnable(GL_TEXTURE_2D);
        glBindTexture(GL_TEXTURE_2D, (!flip || !back_texture) ? tex.ids[0] : tex.ids[1]);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glDrawArrays(GL_TRIANGLE_STRIP, 0, front_count);
        glDisable(GL_BLEND);
        glDisable(GL_TEXTURE_2D);
    }

    // Back: blank then textured
    glDrawArrays(GL_TRIANGLE_STRIP, back_start, back_count);
    if (config.draw_texture) {
        glEnable(GL_BLEND);
        glEnable(GL_TEXTURE_2D);
        glBindTexture(GL_TEXTURE_2D, (flip || !back_texture) ? tex.ids[0] : tex.ids[1]);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glDrawArrays(GL_TRIANGLE_STRIP, back_start, back_count);
        glDisable(GL_BLEND);
        glDisable(GL_TEXTURE_2D);
    }

    glDisableClientState(GL_TEXTURE_COORD_ARRAY);
    glDisableClientState(GL_COLOR_ARRAY);

    if (config.draw_polygon_outlines) {
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glLineWidth(1.0f);
        glColor4f(0.5f, 0.5f, 1.0f, 1.0f);
        glVertexPointer(3, GL_FLOAT, 0, mesh.vertices().data());
        glDrawArrays(GL_LINE_STRIP, 0, front_count);
        glDisable(GL_BLEND);
    }

    if (config.draw_curl_position) {
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glLineWidth(1.0f);
        glColor4f(1.0f, 0.5f, 0.5f, 1.0f);
        glVertexPointer(2, GL_FLOAT, 0, mesh.curl_position_lines().data());
        glDrawArrays(GL_LINES, 0, mesh.curl_position_lines_count() * 2);
        glDisable(GL_BLEND);
    }

    // Self shadow lies on top of the page
    if (config.draw_shadow) {
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glEnableClientState(GL_COLOR_ARRAY);
        glColorPointer(4, GL_FLOAT, 0, mesh.shadow_colors().data());
        glVertexPointer(3, GL_FLOAT, 0, mesh.shadow_vertices().data());
        glDrawArrays(GL_TRIANGLE_STRIP, mesh.drop_shadow_count(), mesh.self_shadow_count());
        glDisableClientState(GL_COLOR_ARRAY);
        glDisable(GL_BLEND);
    }

    glDisableClientState(GL_VERTEX_ARRAY);
}

// Global state for callbacks
static CurlController* g_controller = nullptr;
static bool g_mouse_down = false;
static bool g_dragging = false;
static double g_down_x = 0;
static double g_down_y = 0;
static float g_tap_slop = 6.0f;
static bool g_needs_render = true;

static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods) {
    (void)mods;
    if (button != GLFW_MOUSE_BUTTON_LEFT || !g_controller) {
        return;
    }

    double x = 0;
    double y = 0;
    glfwGetCursorPos(window, &x, &y);

    if (action == GLFW_PRESS) {
        g_mouse_down = true;
        g_dragging = false;
        g_down_x = x;
        g_down_y = y;
    } else if (action == GLFW_RELEASE) {
        if (g_dragging) {
            g_controller->on_drag_end(static_cast<float>(x), static_cast<float>(y));
        } else if (g_mouse_down) {
            g_controller->on_single_tap(static_cast<float>(x), static_cast<float>(y));
        }
        g_mouse_down = false;
        g_dragging = false;
    }
}

static void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
    (void)window;
    if (!g_mouse_down || !g_controller) {
        return;
    }

    if (!g_dragging) {
        // Drag starts once the pointer leaves the tap area, from where it went down
        double dx = xpos - g_down_x;
        double dy = ypos - g_down_y;
        if (std::sqrt(dx * dx + dy * dy) < g_tap_slop) {
            return;
        }
        g_dragging = true;
        g_controller->on_drag_start(static_cast<float>(g_down_x), static_cast<float>(g_down_y));
    }
    g_controller->on_drag_move(static_cast<float>(xpos), static_cast<float>(ypos));
}

static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (!g_controller || (action != GLFW_PRESS && action != GLFW_REPEAT)) {
        return;
    }

    int index = g_controller->current_index();
    if (key == GLFW_KEY_ESCAPE || key == GLFW_KEY_Q) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    } else if (key == GLFW_KEY_RIGHT || key == GLFW_KEY_PAGE_DOWN) {
        g_controller->set_smooth_current_index(index + 1);
    } else if (key == GLFW_KEY_LEFT || key == GLFW_KEY_PAGE_UP) {
        g_controller->set_smooth_current_index(index - 1);
    } else if (key == GLFW_KEY_HOME) {
        g_controller->set_current_index(0);
    } else if (key == GLFW_KEY_END) {
        PageProvider* provider = g_controller->page_provider();
        g_controller->set_current_index(provider ? provider->page_count() : 0);
    } else if (key == GLFW_KEY_T) {
        g_controller->set_view_mode(g_controller->config().view_mode == ViewMode::OnePage
                                    ? ViewMode::TwoPages : ViewMode::OnePage);
    }
}

static void apply_projection(const CurlController& controller, int fb_width, int fb_height) {
    glViewport(0, 0, fb_width, fb_height);
    const RectF& view = controller.layout().view_rect();
    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    glOrtho(view.left, view.right, view.bottom, view.top, -10.0, 10.0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
}

VisualizerResult visualize_pages(
    const ControllerConfig& controller_config,
    const VisualizerConfig& viz_config) {

    auto log = pagecurl::logging::get_logger();
    VisualizerResult result;

    if (!glfwInit()) {
        log->error("Failed to initialize GLFW");
        return result;
    }

    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(
        viz_config.window_width,
        viz_config.window_height,
        viz_config.window_title.c_str(),
        nullptr, nullptr);

    if (!window) {
        log->error("Failed to create GLFW window");
        glfwTerminate();
        return result;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);  // Enable vsync

    glShadeModel(GL_SMOOTH);
    glHint(GL_LINE_SMOOTH_HINT, GL_NICEST);
    glEnable(GL_LINE_SMOOTH);
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    CurlController controller(controller_config);
    DemoPageProvider provider(viz_config.page_count);
    MeshRenderer renderer;

    g_controller = &controller;
    g_tap_slop = viz_config.tap_slop_pixels;
    g_mouse_down = false;
    g_dragging = false;
    g_needs_render = true;

    controller.set_render_request_callback([]() { g_needs_render = true; });
    controller.set_index_changed_callback([&result, &log](int index) {
        ++result.page_turns;
        log->info("Page {}", index);
    });
    controller.set_page_click_callback([&log](int index) {
        log->info("Clicked page {}", index);
    });

    int win_width = 0;
    int win_height = 0;
    glfwGetWindowSize(window, &win_width, &win_height);
    controller.set_viewport(win_width, win_height);
    controller.set_proportional_margins(viz_config.margins.left, viz_config.margins.top,
                                        viz_config.margins.right, viz_config.margins.bottom);
    controller.set_page_provider(&provider);
    controller.on_surface_created();

    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetCursorPosCallback(window, cursor_position_callback);
    glfwSetKeyCallback(window, key_callback);

    log->info("Viewer started with {} pages. Controls:", provider.page_count());
    log->info("  drag=curl page, click=page click");
    log->info("  left/right=animated page jump, home/end=first/last page");
    log->info("  t=toggle one/two pages, q=quit");

    Argb bg = viz_config.background_color;
    int fb_width = 0;
    int fb_height = 0;

    while (!glfwWindowShouldClose(window)) {
        bool animating = controller.on_animation_frame();
        if (!g_needs_render && !animating && !controller.snap_animating()) {
            glfwWaitEventsTimeout(0.1);
            continue;
        }
        g_needs_render = false;

        int w = 0;
        int h = 0;
        glfwGetWindowSize(window, &w, &h);
        if (w != win_width || h != win_height) {
            win_width = w;
            win_height = h;
            controller.set_viewport(w, h);
        }
        glfwGetFramebufferSize(window, &w, &h);
        if (w != fb_width || h != fb_height) {
            fb_width = w;
            fb_height = h;
        }
        apply_projection(controller, fb_width, fb_height);

        controller.on_draw_frame();

        glClearColor(color::red(bg) / 255.0f, color::green(bg) / 255.0f,
                     color::blue(bg) / 255.0f, color::alpha(bg) / 255.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        renderer.prune(controller);
        for (PageMesh* mesh : controller.draw_list()) {
            renderer.draw(*mesh);
        }

        glfwSwapBuffers(window);
        glfwPollEvents();
    }

    renderer.release();
    g_controller = nullptr;

    result.completed = true;
    result.final_index = controller.current_index();

    glfwDestroyWindow(window);
    glfwTerminate();

    log->info("Viewer closed at page {} after {} page changes.", result.final_index, result.page_turns);

    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace pagecurl

#else  // PAGECURL_HAS_VISUALIZATION not defined

namespace pagecurl {

VisualizerResult visualize_pages(
    const ControllerConfig&,
    const VisualizerConfig&) {

    auto log = pagecurl::logging::get_logger();
    log->error("Visualization not available - compile with GLFW and OpenGL");
    return VisualizerResult{};
}

bool visualization_available() {
    return false;
}

}  // namespace pagecurl

#endif  // PAGECURL_HAS_VISUALIZATION
