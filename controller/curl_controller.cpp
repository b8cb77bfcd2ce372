#include "curl_controller.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace pagecurl {

namespace {

constexpr double PI = std::numbers::pi;

bool same_mesh_config(const MeshConfig& a, const MeshConfig& b) {
    return a.max_curl_splits == b.max_curl_splits &&
           a.draw_curl_position == b.draw_curl_position &&
           a.draw_polygon_outlines == b.draw_polygon_outlines &&
           a.draw_shadow == b.draw_shadow &&
           a.draw_texture == b.draw_texture &&
           a.shadow_inner_color == b.shadow_inner_color &&
           a.shadow_outer_color == b.shadow_outer_color &&
           a.color_factor_offset == b.color_factor_offset;
}

const char* to_string(CurlState state) {
    switch (state) {
        case CurlState::Left: return "left";
        case CurlState::Right: return "right";
        case CurlState::None:
        default: return "none";
    }
}

}  // anonymous namespace

void ControllerConfig::validate() const {
    mesh.validate();
    if (mesh.max_curl_splits < 1) {
        throw std::invalid_argument("max_curl_splits must be at least 1");
    }
    if (!std::isfinite(animation_duration_ms) || animation_duration_ms < 0.0) {
        throw std::invalid_argument("animation_duration_ms must be non-negative");
    }
    if (!std::isfinite(page_jump_duration_ms) || page_jump_duration_ms < 0.0) {
        throw std::invalid_argument("page_jump_duration_ms must be non-negative");
    }
}

double steady_clock_ms() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double, std::milli>(now).count();
}

CurlController::CurlController(const ControllerConfig& config, ClockFunction clock)
    : config_(config), clock_(std::move(clock)) {
    config_.validate();
    if (!clock_) {
        clock_ = steady_clock_ms;
    }
    draw_list_.reserve(3);
    layout_.set_view_mode(config_.view_mode);
    rebuild_pages();
}

// ============================================================================
// Binding and configuration
// ============================================================================

void CurlController::set_page_provider(PageProvider* provider) {
    provider_ = provider;

    animator_.cancel();
    pending_jump_.reset();
    catching_up_ = false;
    dragging_ = false;
    animate_ = false;
    curl_state_ = CurlState::None;

    current_index_ = 0;
    last_notified_index_ = 0;
    notify_pending_ = false;

    update_pages();
    request_render();
}

void CurlController::set_config(const ControllerConfig& config) {
    config.validate();

    bool mesh_changed = !same_mesh_config(config.mesh, config_.mesh);
    if (mesh_changed && provider_ != nullptr) {
        throw std::logic_error("mesh configuration cannot change while a page provider is attached");
    }
    bool view_mode_changed = config.view_mode != config_.view_mode;

    config_ = config;
    if (mesh_changed) {
        rebuild_pages();
    }
    if (view_mode_changed) {
        set_view_mode(config.view_mode);
    }
}

void CurlController::set_viewport(int width, int height) {
    layout_.set_viewport(width, height);
    refresh_layout();
}

void CurlController::set_margins(int left, int top, int right, int bottom) {
    layout_.set_margins(left, top, right, bottom);
    refresh_layout();
}

void CurlController::set_proportional_margins(float left, float top, float right, float bottom) {
    layout_.set_proportional_margins(left, top, right, bottom);
    refresh_layout();
}

void CurlController::set_view_mode(ViewMode mode) {
    config_.view_mode = mode;
    mesh(MeshRole::Left).set_flip_texture(mode == ViewMode::OnePage);
    layout_.set_view_mode(mode);
    refresh_layout();
}

void CurlController::on_surface_created() {
    update_pages();
    request_render();
}

void CurlController::set_render_request_callback(RenderRequestCallback callback) {
    on_render_request_ = std::move(callback);
}

void CurlController::set_index_changed_callback(IndexChangedCallback callback) {
    on_index_changed_ = std::move(callback);
}

void CurlController::set_page_click_callback(PageClickCallback callback) {
    on_page_click_ = std::move(callback);
}

void CurlController::rebuild_pages() {
    bool had_left = false;
    bool had_right = false;
    bool had_curl = false;
    if (meshes_[0]) {
        had_left = remove_from_draw_list(mesh(MeshRole::Left));
        had_right = remove_from_draw_list(mesh(MeshRole::Right));
        had_curl = remove_from_draw_list(mesh(MeshRole::Curl));
    }

    for (auto& m : meshes_) {
        m = std::make_unique<PageMesh>(config_.mesh);
    }
    mesh(MeshRole::Left).set_flip_texture(true);
    mesh(MeshRole::Right).set_flip_texture(false);

    if (had_left) {
        add_to_draw_list(mesh(MeshRole::Left));
    }
    if (had_right) {
        add_to_draw_list(mesh(MeshRole::Right));
    }
    if (had_curl) {
        add_to_draw_list(mesh(MeshRole::Curl));
    }

    logging::get_logger()->info("CurlController: built meshes with {} curl splits",
                                mesh(MeshRole::Curl).max_curl_splits());
}

void CurlController::refresh_layout() {
    if (!layout_.valid()) {
        return;
    }
    auto [width, height] = layout_.page_bitmap_size();
    page_bitmap_width_ = width;
    page_bitmap_height_ = height;
    update_pages();
    request_render();
}

// ============================================================================
// Input
// ============================================================================

void CurlController::on_drag_start(float x, float y, float pressure) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    auto left_rect = layout_.page_rect(PageSlot::Left);
    if (!right_rect || !left_rect) {
        logging::get_logger()->debug("CurlController: drag ignored, no layout");
        return;
    }

    settle_animations();
    dragging_ = true;

    update_first_curl_pos(x, y, pressure, std::nullopt);

    // Catch up from the page edge to the live pointer
    float edge;
    if (curl_state_ == CurlState::Right) {
        edge = right_rect->right;
    } else if (config_.view_mode == ViewMode::OnePage) {
        edge = right_rect->left;
    } else {
        edge = left_rect->left;
    }
    float start_x = layout_.inverse_translate_x(edge);
    float start_y = y;
    float start_p = pressure;
    scroll_x_ = start_x;
    scroll_y_ = start_y;
    scroll_p_ = start_p;

    catching_up_ = true;
    animator_.start(0.0f, 1.0f, config_.animation_duration_ms, Interpolator::Linear, clock_(),
        [this, start_x, start_y, start_p](float v) {
            update_curl_pos(start_x * (1.0f - v) + v * scroll_x_,
                            start_y * (1.0f - v) + v * scroll_y_,
                            start_p * (1.0f - v) + v * scroll_p_);
        },
        [this]() { catching_up_ = false; });
}

void CurlController::on_drag_move(float x, float y, float pressure) {
    if (!dragging_) {
        return;
    }
    scroll_x_ = x;
    scroll_y_ = y;
    scroll_p_ = pressure;
    update_curl_pos(x, y, pressure);
}

void CurlController::on_drag_end(float x, float y, float pressure) {
    if (!dragging_) {
        return;
    }
    dragging_ = false;
    if (catching_up_) {
        animator_.cancel();
        catching_up_ = false;
    }
    update_last_curl_pos(x, y, pressure, std::nullopt);
}

void CurlController::on_single_tap(float /*x*/, float /*y*/) {
    if (on_page_click_) {
        on_page_click_(current_index_);
    }
}

void CurlController::set_current_index(int index) {
    int new_index = clamp_index(index);
    if (new_index == current_index_ && curl_state_ == CurlState::None && !animate_ &&
        !animator_.running()) {
        return;
    }

    current_index_ = new_index;
    notify_pending_ = true;
    update_pages();
    request_render();
}

void CurlController::set_smooth_current_index(int index) {
    int new_index = clamp_index(index);
    settle_animations();

    if (current_index_ < new_index) {
        animate_curl_right(new_index);
    } else if (current_index_ > new_index) {
        animate_curl_left(new_index);
    } else {
        request_render();
    }
}

// ============================================================================
// Frame callbacks
// ============================================================================

void CurlController::on_draw_frame() {
    if (!animate_) {
        if (notify_pending_) {
            notify_pending_ = false;
            if (current_index_ != last_notified_index_) {
                last_notified_index_ = current_index_;
                if (on_index_changed_) {
                    on_index_changed_(current_index_);
                }
            }
        }
        return;
    }

    double now = clock_();
    double duration = config_.animation_duration_ms;
    if (now >= animation_start_ms_ + duration) {
        finish_snap();
        return;
    }

    float t = 1.0f - static_cast<float>((now - animation_start_ms_) / duration);
    t = 1.0f - (t * t * t * (3.0f - 2.0f * t));
    pointer_pos_.pos = animation_source_ + (animation_target_ - animation_source_) * t;
    update_curl_pos(pointer_pos_);
}

bool CurlController::on_animation_frame() {
    return animator_.tick(clock_());
}

bool CurlController::in_draw_list(MeshRole role) const {
    const PageMesh* m = meshes_[static_cast<size_t>(role)].get();
    return std::find(draw_list_.begin(), draw_list_.end(), m) != draw_list_.end();
}

bool CurlController::owns_mesh(uint64_t id) const {
    return std::any_of(meshes_.begin(), meshes_.end(),
                       [id](const std::unique_ptr<PageMesh>& m) { return m && m->id() == id; });
}

// ============================================================================
// Curl state machine
// ============================================================================

int CurlController::clamp_index(int index) const {
    if (provider_ == nullptr || index < 0) {
        return 0;
    }
    int count = provider_->page_count();
    int max_index = config_.allow_last_page_curl ? count : count - 1;
    return std::max(0, std::min(index, max_index));
}

void CurlController::finish_snap() {
    auto log = logging::get_logger();
    RectF right_rect = layout_.page_rect(PageSlot::Right).value_or(RectF{});
    RectF left_rect = layout_.page_rect(PageSlot::Left).value_or(RectF{});
    std::optional<int> target = target_index_;
    CurlState state = curl_state_;

    if (animation_target_event_ == SnapTarget::ToRight) {
        PageMesh& curl = mesh(MeshRole::Curl);
        curl.set_rect(right_rect);
        curl.set_flip_texture(false);
        curl.reset();
        remove_from_draw_list(mesh(MeshRole::Right));
        swap_roles(MeshRole::Curl, MeshRole::Right);

        if (state == CurlState::Left) {
            current_index_ = target.value_or(current_index_ - 1);
        }
    } else {
        PageMesh& curl = mesh(MeshRole::Curl);
        curl.set_rect(left_rect);
        curl.set_flip_texture(true);
        curl.reset();
        remove_from_draw_list(mesh(MeshRole::Left));
        if (!config_.render_left_page) {
            remove_from_draw_list(curl);
        }
        swap_roles(MeshRole::Curl, MeshRole::Left);

        if (state == CurlState::Right) {
            current_index_ = target.value_or(current_index_ + 1);
        }
    }

    log->debug("CurlController: {} curl settled {}, index {}", to_string(state),
               animation_target_event_ == SnapTarget::ToRight ? "right" : "left", current_index_);

    curl_state_ = CurlState::None;
    animate_ = false;
    notify_pending_ = true;
    target_index_.reset();
    if (target) {
        update_pages();
    }
    request_render();
}

void CurlController::settle_animations() {
    std::optional<PendingJump> jump = pending_jump_;
    pending_jump_.reset();
    animator_.cancel();
    catching_up_ = false;

    if (jump) {
        update_last_curl_pos(jump->end_x, jump->y, 0.0f, jump->index);
    } else if (curl_state_ != CurlState::None && !animate_) {
        // Drag that never ended
        update_last_curl_pos(scroll_x_, scroll_y_, scroll_p_, std::nullopt);
    }

    if (animate_) {
        finish_snap();
    }
}

void CurlController::update_first_curl_pos(float x, float y, float pressure,
                                           std::optional<int> new_index) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    auto left_rect = layout_.page_rect(PageSlot::Left);
    if (!right_rect || !left_rect || provider_ == nullptr) {
        return;
    }

    pointer_pos_ = to_pointer(x, y, pressure);

    // The page is held at its outer edge, at the pointer's height
    drag_start_pos_ = pointer_pos_.pos;
    if (drag_start_pos_.y > right_rect->top) {
        drag_start_pos_.y = right_rect->top;
    } else if (drag_start_pos_.y < right_rect->bottom) {
        drag_start_pos_.y = right_rect->bottom;
    }

    int count = provider_->page_count();
    float split = config_.view_mode == ViewMode::TwoPages ? right_rect->left
                                                          : right_rect->center_x();

    if (drag_start_pos_.x < split && current_index_ > 0) {
        drag_start_pos_.x = config_.view_mode == ViewMode::TwoPages ? left_rect->left
                                                                    : right_rect->left;
        start_curl(CurlState::Left, new_index);
    } else if (drag_start_pos_.x >= split && current_index_ < count) {
        drag_start_pos_.x = right_rect->right;
        if (!config_.allow_last_page_curl && current_index_ >= count - 1) {
            return;
        }
        start_curl(CurlState::Right, new_index);
    }

    if (curl_state_ == CurlState::None) {
        return;
    }
    update_curl_pos(pointer_pos_);
}

void CurlController::update_last_curl_pos(float x, float y, float pressure,
                                          std::optional<int> new_index) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    auto left_rect = layout_.page_rect(PageSlot::Left);
    if (!right_rect || !left_rect) {
        return;
    }

    pointer_pos_ = to_pointer(x, y, pressure);
    if (curl_state_ == CurlState::None) {
        return;
    }

    // Snap as if the pointer kept dragging to the nearer edge
    animation_source_ = pointer_pos_.pos;
    animation_start_ms_ = clock_();

    bool one_page = config_.view_mode == ViewMode::OnePage;
    if ((one_page && pointer_pos_.pos.x > right_rect->center_x()) ||
        (!one_page && pointer_pos_.pos.x > right_rect->left)) {
        animation_target_ = drag_start_pos_;
        animation_target_.x = right_rect->right;
        animation_target_event_ = SnapTarget::ToRight;
    } else {
        animation_target_ = drag_start_pos_;
        if (curl_state_ == CurlState::Right || !one_page) {
            animation_target_.x = left_rect->left;
        } else {
            animation_target_.x = right_rect->left;
        }
        animation_target_event_ = SnapTarget::ToLeft;
    }

    target_index_ = new_index;
    animate_ = true;
    request_render();
}

void CurlController::update_curl_pos(float x, float y, float pressure) {
    if (curl_state_ == CurlState::None) {
        return;
    }
    pointer_pos_ = to_pointer(x, y, pressure);
    update_curl_pos(pointer_pos_);
}

void CurlController::update_curl_pos(const PointerPosition& pointer) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    if (!right_rect || curl_state_ == CurlState::None) {
        return;
    }

    double radius = right_rect->width() / 3.0;
    radius *= std::max(1.0f - pointer.pressure, 0.0f);

    Vec2 pos = pointer.pos;
    Vec2 dir = curl_dir_;
    bool two_pages = config_.view_mode == ViewMode::TwoPages;

    if (curl_state_ == CurlState::Right || (curl_state_ == CurlState::Left && two_pages)) {
        dir = pos - drag_start_pos_;
        double dist = dir.length();

        // Radius shrinks as the page is dragged far across
        double page_width = right_rect->width();
        double curl_len = radius * PI;
        if (dist > (page_width * 2.0) - curl_len) {
            curl_len = std::max((page_width * 2.0) - dist, 0.0);
            radius = curl_len / PI;
        }

        if (dist > 0.0) {
            if (dist >= curl_len) {
                double translate = (dist - curl_len) / 2.0;
                if (two_pages) {
                    pos.x -= static_cast<float>(dir.x * translate / dist);
                } else {
                    radius = std::max(std::min(static_cast<double>(pos.x - right_rect->left), radius), 0.0);
                }
                pos.y -= static_cast<float>(dir.y * translate / dist);
            } else {
                double angle = PI * std::sqrt(dist / curl_len);
                double translate = radius * std::sin(angle);
                pos.x += static_cast<float>(dir.x * translate / dist);
                pos.y += static_cast<float>(dir.y * translate / dist);
            }
        }
    } else if (curl_state_ == CurlState::Left) {
        // One page mode, the curl follows the pointer
        radius = std::max(std::min(static_cast<double>(pos.x - right_rect->left), radius), 0.0);
        pos.x -= std::min(right_rect->right - pos.x, static_cast<float>(radius));
        dir.x = pos.x + drag_start_pos_.x;
        dir.y = pos.y - drag_start_pos_.y;
    }

    set_curl_pos(pos, dir, radius);
}

void CurlController::set_curl_pos(Vec2 pos, Vec2 dir, double radius) {
    bool one_page = config_.view_mode == ViewMode::OnePage;

    // Keep the page attached to the spine
    if (curl_state_ == CurlState::Right || (curl_state_ == CurlState::Left && one_page)) {
        auto rect = layout_.page_rect(PageSlot::Right);
        if (!rect) {
            return;
        }
        if (pos.x >= rect->right) {
            mesh(MeshRole::Curl).reset();
            request_render();
            return;
        }
        if (pos.x < rect->left) {
            pos.x = rect->left;
        }
        if (dir.y != 0.0f) {
            float diff_x = pos.x - rect->left;
            float left_y = pos.y + (diff_x * dir.x / dir.y);
            if (dir.y < 0.0f && left_y < rect->top) {
                dir.x = pos.y - rect->top;
                dir.y = rect->left - pos.x;
            } else if (dir.y > 0.0f && left_y > rect->bottom) {
                dir.x = rect->bottom - pos.y;
                dir.y = pos.x - rect->left;
            }
        }
    } else if (curl_state_ == CurlState::Left) {
        auto rect = layout_.page_rect(PageSlot::Left);
        if (!rect) {
            return;
        }
        if (pos.x <= rect->left) {
            mesh(MeshRole::Curl).reset();
            request_render();
            return;
        }
        if (pos.x > rect->right) {
            pos.x = rect->right;
        }
        if (dir.y != 0.0f) {
            float diff_x = pos.x - rect->right;
            float right_y = pos.y + (diff_x * dir.x / dir.y);
            if (dir.y < 0.0f && right_y < rect->top) {
                dir.x = rect->top - pos.y;
                dir.y = pos.x - rect->right;
            } else if (dir.y > 0.0f && right_y > rect->bottom) {
                dir.x = pos.y - rect->bottom;
                dir.y = rect->right - pos.x;
            }
        }
    }

    curl_pos_ = pos;
    curl_radius_ = radius;

    float dist = dir.length();
    if (dist != 0.0f) {
        curl_dir_ = dir / dist;
        mesh(MeshRole::Curl).curl(curl_pos_, curl_dir_, curl_radius_);
    } else {
        curl_dir_ = dir;
        mesh(MeshRole::Curl).reset();
    }

    request_render();
}

void CurlController::start_curl(CurlState page, std::optional<int> new_index) {
    RectF right_rect = layout_.page_rect(PageSlot::Right).value_or(RectF{});
    RectF left_rect = layout_.page_rect(PageSlot::Left).value_or(RectF{});
    int count = provider_ != nullptr ? provider_->page_count() : 0;

    remove_from_draw_list(mesh(MeshRole::Left));
    remove_from_draw_list(mesh(MeshRole::Right));
    remove_from_draw_list(mesh(MeshRole::Curl));

    if (page == CurlState::Right) {
        int target = new_index.value_or(current_index_ + 1);

        // Current page starts curling, next page goes underneath
        swap_roles(MeshRole::Right, MeshRole::Curl);

        if (current_index_ > 0) {
            PageMesh& left = mesh(MeshRole::Left);
            left.set_flip_texture(true);
            left.set_rect(left_rect);
            left.reset();
            if (config_.render_left_page) {
                add_to_draw_list(left);
            }
        }
        if (target < count) {
            PageMesh& right = mesh(MeshRole::Right);
            update_page(right.content(), target);
            right.set_rect(right_rect);
            right.set_flip_texture(false);
            right.reset();
            add_to_draw_list(right);
        }

        PageMesh& curl = mesh(MeshRole::Curl);
        curl.set_rect(right_rect);
        curl.set_flip_texture(false);
        curl.reset();
        add_to_draw_list(curl);

        curl_state_ = CurlState::Right;
    } else if (page == CurlState::Left) {
        int target = new_index.value_or(current_index_ - 1);

        // Previous page starts curling back, the one before it goes underneath
        swap_roles(MeshRole::Left, MeshRole::Curl);

        if (target > 0) {
            PageMesh& left = mesh(MeshRole::Left);
            update_page(left.content(), target - 1, target);
            left.set_flip_texture(true);
            left.set_rect(left_rect);
            left.reset();
            if (config_.render_left_page) {
                add_to_draw_list(left);
            }
        }
        if (current_index_ < count) {
            PageMesh& right = mesh(MeshRole::Right);
            right.set_flip_texture(false);
            right.set_rect(right_rect);
            right.reset();
            add_to_draw_list(right);
        }

        PageMesh& curl = mesh(MeshRole::Curl);
        if (config_.view_mode == ViewMode::OnePage ||
            (curl_state_ == CurlState::Left && config_.view_mode == ViewMode::TwoPages)) {
            curl.set_rect(right_rect);
            curl.set_flip_texture(false);
        } else {
            curl.set_rect(left_rect);
            curl.set_flip_texture(true);
        }
        curl.reset();
        add_to_draw_list(curl);

        curl_state_ = CurlState::Left;
    }

    logging::get_logger()->debug("CurlController: started {} curl at index {}",
                                 to_string(curl_state_), current_index_);
}

void CurlController::animate_curl_right(int new_index) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    auto left_rect = layout_.page_rect(PageSlot::Left);
    if (!right_rect || !left_rect) {
        return;
    }

    float y = layout_.inverse_translate_y(right_rect->center_y());
    float start_x = layout_.inverse_translate_x(right_rect->right);
    float end_x = layout_.inverse_translate_x(
        config_.view_mode == ViewMode::OnePage ? right_rect->left : left_rect->left);

    // Back of the curling page shows the page before the destination
    if (new_index > 0) {
        update_pages(std::nullopt, new_index - 1);
    }

    animate_curl(start_x, end_x, y, new_index);
}

void CurlController::animate_curl_left(int new_index) {
    auto right_rect = layout_.page_rect(PageSlot::Right);
    auto left_rect = layout_.page_rect(PageSlot::Left);
    if (!right_rect || !left_rect) {
        return;
    }

    float y = layout_.inverse_translate_y(right_rect->center_y());
    float start_x = layout_.inverse_translate_x(
        config_.view_mode == ViewMode::OnePage ? right_rect->left : left_rect->left);
    float end_x = layout_.inverse_translate_x(right_rect->right);

    update_pages(new_index, std::nullopt);

    animate_curl(start_x, end_x, y, new_index);
}

void CurlController::animate_curl(float start_x, float end_x, float y, int new_index) {
    settle_animations();

    update_first_curl_pos(start_x, y, 0.0f, new_index);
    if (curl_state_ == CurlState::None) {
        logging::get_logger()->debug("CurlController: jump to {} has nothing to curl", new_index);
        request_render();
        return;
    }

    pending_jump_ = PendingJump{end_x, y, new_index};
    animator_.start(start_x, end_x, config_.page_jump_duration_ms, Interpolator::Accelerate, clock_(),
        [this, y](float x) { update_curl_pos(x, y, 0.0f); },
        [this]() {
            std::optional<PendingJump> jump = pending_jump_;
            pending_jump_.reset();
            if (jump) {
                update_last_curl_pos(jump->end_x, jump->y, 0.0f, jump->index);
            }
        });
}

void CurlController::update_page(PageContent& content, int index, std::optional<int> back_index) {
    content.reset();
    if (provider_ != nullptr) {
        provider_->update_page(content, page_bitmap_width_, page_bitmap_height_, index, back_index);
    }
}

void CurlController::update_pages(std::optional<int> target_left, std::optional<int> target_right) {
    if (page_bitmap_width_ <= 0 || page_bitmap_height_ <= 0 || provider_ == nullptr) {
        return;
    }

    RectF right_rect = layout_.page_rect(PageSlot::Right).value_or(RectF{});
    RectF left_rect = layout_.page_rect(PageSlot::Left).value_or(RectF{});

    PageMesh& left = mesh(MeshRole::Left);
    PageMesh& right = mesh(MeshRole::Right);
    PageMesh& curl = mesh(MeshRole::Curl);
    remove_from_draw_list(left);
    remove_from_draw_list(right);
    remove_from_draw_list(curl);

    int left_idx = current_index_ - 1;
    int right_idx = current_index_;
    int curl_idx = -1;
    if (curl_state_ == CurlState::Left) {
        curl_idx = left_idx;
        --left_idx;
    } else if (curl_state_ == CurlState::Right) {
        curl_idx = right_idx;
        ++right_idx;
    }

    int count = provider_->page_count();

    if (right_idx >= 0 && right_idx < count) {
        update_page(right.content(), right_idx, target_right);
        right.set_flip_texture(false);
        right.set_rect(right_rect);
        right.reset();
        add_to_draw_list(right);
    }
    if (left_idx >= 0 && left_idx < count) {
        update_page(left.content(), target_left.value_or(left_idx), left_idx);
        left.set_flip_texture(true);
        left.set_rect(left_rect);
        left.reset();
        if (config_.render_left_page) {
            add_to_draw_list(left);
        }
    }
    if (curl_idx >= 0 && curl_idx < count) {
        update_page(curl.content(), curl_idx);
        if (curl_state_ == CurlState::Right || config_.view_mode == ViewMode::OnePage) {
            curl.set_flip_texture(false);
            curl.set_rect(right_rect);
        } else {
            curl.set_flip_texture(true);
            curl.set_rect(left_rect);
        }
        curl.reset();
        add_to_draw_list(curl);
    }
}

// ============================================================================
// Helpers
// ============================================================================

void CurlController::add_to_draw_list(PageMesh& m) {
    remove_from_draw_list(m);
    draw_list_.push_back(&m);
}

bool CurlController::remove_from_draw_list(PageMesh& m) {
    auto it = std::remove(draw_list_.begin(), draw_list_.end(), &m);
    bool removed = it != draw_list_.end();
    draw_list_.erase(it, draw_list_.end());
    return removed;
}

void CurlController::swap_roles(MeshRole a, MeshRole b) {
    std::swap(meshes_[static_cast<size_t>(a)], meshes_[static_cast<size_t>(b)]);
}

void CurlController::request_render() {
    if (on_render_request_) {
        on_render_request_();
    }
}

CurlController::PointerPosition CurlController::to_pointer(float x, float y, float pressure) const {
    PointerPosition pointer;
    pointer.pos = layout_.translate(Vec2(x, y));
    pointer.pressure = config_.enable_touch_pressure ? pressure : 0.8f;
    return pointer;
}

}  // namespace pagecurl
