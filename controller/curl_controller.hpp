#ifndef PAGECURL_CONTROLLER_CURL_CONTROLLER_HPP
#define PAGECURL_CONTROLLER_CURL_CONTROLLER_HPP

#include "curl_animator.hpp"
#include <layout/page_layout.hpp>
#include <mesh/page_mesh.hpp>
#include <math/vec2.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace pagecurl {

// Supplies page imagery. Called synchronously from controller operations;
// implementations must not call back into the controller.
class PageProvider {
public:
    virtual ~PageProvider() = default;

    virtual int page_count() const = 0;

    // Fill content for page index. When back_index is set the back side shows
    // that page instead of the default.
    virtual void update_page(PageContent& content, int width, int height,
                             int index, std::optional<int> back_index) = 0;
};

enum class CurlState {
    None,
    Left,    // previous page is being turned back
    Right    // current page is being turned forward
};

enum class MeshRole {
    Left = 0,
    Right = 1,
    Curl = 2
};

struct ControllerConfig {
    MeshConfig mesh;                        // Can only change while no provider is attached
    bool allow_last_page_curl = true;       // Current page may be turned past the last page
    double animation_duration_ms = 300.0;   // Snap and catch-up animations
    double page_jump_duration_ms = 500.0;   // set_smooth_current_index()
    bool enable_touch_pressure = false;     // Otherwise pressure is fixed at 0.8
    bool render_left_page = true;
    ViewMode view_mode = ViewMode::OnePage;

    // Throws std::invalid_argument on out of range values
    void validate() const;
};

using ClockFunction = std::function<double()>;

// Milliseconds from std::chrono::steady_clock
double steady_clock_ms();

// Page-turn state machine.
//
// Owns three meshes in the roles left, right and curl, and swaps roles as pages
// turn. Pointer input is given in viewport pixels. The host calls
// on_draw_frame() before rendering the draw list and on_animation_frame() on
// each animation tick, both on the same thread as input.
class CurlController {
public:
    using RenderRequestCallback = std::function<void()>;
    using IndexChangedCallback = std::function<void(int index)>;
    using PageClickCallback = std::function<void(int index)>;

    explicit CurlController(const ControllerConfig& config = ControllerConfig{},
                            ClockFunction clock = steady_clock_ms);

    CurlController(const CurlController&) = delete;
    CurlController& operator=(const CurlController&) = delete;

    // Resets the current index to 0 and repopulates pages. Not owned.
    void set_page_provider(PageProvider* provider);
    PageProvider* page_provider() const { return provider_; }

    // Mesh settings rebuild the meshes and throw std::logic_error while a
    // provider is attached
    void set_config(const ControllerConfig& config);
    const ControllerConfig& config() const { return config_; }

    void set_viewport(int width, int height);
    void set_margins(int left, int top, int right, int bottom);
    void set_proportional_margins(float left, float top, float right, float bottom);
    void set_view_mode(ViewMode mode);

    // New graphics context, content is handed out again for upload
    void on_surface_created();

    void set_render_request_callback(RenderRequestCallback callback);
    void set_index_changed_callback(IndexChangedCallback callback);
    void set_page_click_callback(PageClickCallback callback);

    // Pointer input
    void on_drag_start(float x, float y, float pressure = 0.0f);
    void on_drag_move(float x, float y, float pressure = 0.0f);
    void on_drag_end(float x, float y, float pressure = 0.0f);
    void on_single_tap(float x, float y);

    void set_current_index(int index);
    void set_smooth_current_index(int index);

    // Advances the snap animation; call once per frame before drawing
    void on_draw_frame();

    // Advances catch-up and page jump animations; returns true while running
    bool on_animation_frame();

    int current_index() const { return current_index_; }
    CurlState curl_state() const { return curl_state_; }
    bool snap_animating() const { return animate_; }
    bool animator_running() const { return animator_.running(); }

    const PageLayout& layout() const { return layout_; }

    PageMesh& mesh(MeshRole role) { return *meshes_[static_cast<size_t>(role)]; }
    const PageMesh& mesh(MeshRole role) const { return *meshes_[static_cast<size_t>(role)]; }

    // Meshes to render, in drawing order
    const std::vector<PageMesh*>& draw_list() const { return draw_list_; }
    bool in_draw_list(MeshRole role) const;

    // True while one of the three meshes has this id. Rebuilding the meshes
    // retires the old ids.
    bool owns_mesh(uint64_t id) const;

    Vec2 curl_position() const { return curl_pos_; }
    Vec2 curl_direction() const { return curl_dir_; }
    double curl_radius() const { return curl_radius_; }

    int page_bitmap_width() const { return page_bitmap_width_; }
    int page_bitmap_height() const { return page_bitmap_height_; }

private:
    enum class SnapTarget {
        ToLeft,
        ToRight
    };

    struct PointerPosition {
        Vec2 pos;
        float pressure = 0.0f;
    };

    // Where a running page jump ends
    struct PendingJump {
        float end_x = 0.0f;
        float y = 0.0f;
        int index = 0;
    };

    void rebuild_pages();
    void refresh_layout();

    int clamp_index(int index) const;
    void finish_snap();
    void settle_animations();

    void update_first_curl_pos(float x, float y, float pressure, std::optional<int> new_index);
    void update_last_curl_pos(float x, float y, float pressure, std::optional<int> new_index);
    void update_curl_pos(float x, float y, float pressure);
    void update_curl_pos(const PointerPosition& pointer);
    void set_curl_pos(Vec2 pos, Vec2 dir, double radius);

    void start_curl(CurlState page, std::optional<int> new_index);
    void animate_curl_right(int new_index);
    void animate_curl_left(int new_index);
    void animate_curl(float start_x, float end_x, float y, int new_index);

    void update_page(PageContent& content, int index, std::optional<int> back_index = std::nullopt);
    void update_pages(std::optional<int> target_left = std::nullopt,
                      std::optional<int> target_right = std::nullopt);

    void add_to_draw_list(PageMesh& mesh);
    bool remove_from_draw_list(PageMesh& mesh);
    void swap_roles(MeshRole a, MeshRole b);

    void request_render();
    PointerPosition to_pointer(float x, float y, float pressure) const;

    ControllerConfig config_;
    ClockFunction clock_;
    PageLayout layout_;
    PageProvider* provider_ = nullptr;

    std::array<std::unique_ptr<PageMesh>, 3> meshes_;
    std::vector<PageMesh*> draw_list_;

    CurlState curl_state_ = CurlState::None;
    int current_index_ = 0;
    std::optional<int> target_index_;

    // Snap animation
    bool animate_ = false;
    Vec2 animation_source_;
    Vec2 animation_target_;
    double animation_start_ms_ = 0.0;
    SnapTarget animation_target_event_ = SnapTarget::ToRight;

    // Catch-up and page jump animations
    CurlAnimator animator_;
    bool catching_up_ = false;
    std::optional<PendingJump> pending_jump_;
    bool dragging_ = false;
    float scroll_x_ = 0.0f;
    float scroll_y_ = 0.0f;
    float scroll_p_ = 0.0f;

    Vec2 drag_start_pos_;
    PointerPosition pointer_pos_;
    Vec2 curl_pos_;
    Vec2 curl_dir_;
    double curl_radius_ = 0.0;

    int page_bitmap_width_ = -1;
    int page_bitmap_height_ = -1;

    bool notify_pending_ = false;
    int last_notified_index_ = 0;

    RenderRequestCallback on_render_request_;
    IndexChangedCallback on_index_changed_;
    PageClickCallback on_page_click_;
};

}  // namespace pagecurl

#endif // PAGECURL_CONTROLLER_CURL_CONTROLLER_HPP
