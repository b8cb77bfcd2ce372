#include <gtest/gtest.h>
#include "curl_controller.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace pagecurl;
using namespace pagecurl::test;

class CurlControllerTest : public ::testing::Test {
protected:
    CurlControllerTest() : controller(ControllerConfig{}, clock.function()) {}

    void SetUp() override {
        controller.set_index_changed_callback([this](int index) { changes.push_back(index); });
        controller.set_render_request_callback([this]() { ++render_requests; });
        attach(controller, provider);
    }

    bool requested(int index, std::optional<int> back_index) const {
        return std::any_of(provider.requests.begin(), provider.requests.end(),
                           [&](const FakePageProvider::Request& r) {
                               return r.index == index && r.back_index == back_index;
                           });
    }

    FakeClock clock;
    FakePageProvider provider{5};
    CurlController controller;
    std::vector<int> changes;
    int render_requests = 0;
};

TEST_F(CurlControllerTest, InitialState) {
    EXPECT_EQ(controller.current_index(), 0);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_FALSE(controller.snap_animating());
    EXPECT_EQ(controller.page_bitmap_width(), 200);
    EXPECT_EQ(controller.page_bitmap_height(), 100);

    ASSERT_EQ(provider.requests.size(), 1u);
    EXPECT_EQ(provider.requests[0].index, 0);
    EXPECT_FALSE(provider.requests[0].back_index.has_value());
    EXPECT_EQ(provider.requests[0].width, 200);
    EXPECT_EQ(provider.requests[0].height, 100);

    ASSERT_EQ(controller.draw_list().size(), 1u);
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Right));
}

TEST_F(CurlControllerTest, DragForwardTurnsPage) {
    controller.on_drag_start(180.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::Right);
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Curl));
    EXPECT_TRUE(requested(1, std::nullopt));

    controller.on_drag_move(40.0f, 50.0f);
    controller.on_drag_end(40.0f, 50.0f);
    EXPECT_TRUE(controller.snap_animating());

    clock.advance(301.0);
    controller.on_draw_frame();
    EXPECT_FALSE(controller.snap_animating());
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_EQ(controller.current_index(), 1);

    // Turned page now lies on the left, flipped
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Left));
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Right));
    EXPECT_FALSE(controller.in_draw_list(MeshRole::Curl));
    EXPECT_TRUE(controller.mesh(MeshRole::Left).flip_texture());

    // Listeners hear about it on the next frame
    EXPECT_TRUE(changes.empty());
    controller.on_draw_frame();
    EXPECT_EQ(changes, std::vector<int>{1});
}

TEST_F(CurlControllerTest, ShortDragSnapsBack) {
    drag(controller, clock, 180.0f, 150.0f);
    controller.on_draw_frame();

    EXPECT_EQ(controller.current_index(), 0);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_TRUE(changes.empty());
    ASSERT_EQ(controller.draw_list().size(), 1u);
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Right));
}

TEST_F(CurlControllerTest, BackwardDragOnFirstPageIgnored) {
    controller.on_drag_start(20.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    controller.on_drag_move(150.0f, 50.0f);
    controller.on_drag_end(150.0f, 50.0f);
    EXPECT_FALSE(controller.snap_animating());
    EXPECT_EQ(controller.current_index(), 0);
}

TEST_F(CurlControllerTest, DragBackTurnsToPreviousPage) {
    controller.set_current_index(2);
    controller.on_draw_frame();

    controller.on_drag_start(20.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::Left);
    // Page underneath the curl, with the curling page on its back
    EXPECT_TRUE(requested(0, 1));

    controller.on_drag_move(190.0f, 50.0f);
    controller.on_drag_end(190.0f, 50.0f);
    controller.on_draw_frame();
    clock.advance(301.0);
    controller.on_draw_frame();
    controller.on_draw_frame();

    EXPECT_EQ(controller.current_index(), 1);
    EXPECT_EQ(changes, (std::vector<int>{2, 1}));
}

TEST_F(CurlControllerTest, ClampsIndex) {
    controller.set_current_index(10);
    EXPECT_EQ(controller.current_index(), 5);

    controller.set_current_index(-3);
    EXPECT_EQ(controller.current_index(), 0);
}

TEST_F(CurlControllerTest, PastLastPageShowsOnlyLeft) {
    controller.set_current_index(5);
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Left));
    EXPECT_FALSE(controller.in_draw_list(MeshRole::Right));

    // Nothing left to turn forward
    controller.on_drag_start(180.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
}

TEST_F(CurlControllerTest, SmoothJumpForward) {
    controller.set_smooth_current_index(3);
    EXPECT_EQ(controller.curl_state(), CurlState::Right);
    EXPECT_TRUE(controller.animator_running());

    // The curling page shows the page before the target on its back
    EXPECT_TRUE(requested(0, 2));
    EXPECT_TRUE(requested(3, std::nullopt));

    clock.advance(250.0);
    EXPECT_TRUE(controller.on_animation_frame());

    clock.advance(300.0);
    EXPECT_FALSE(controller.on_animation_frame());
    EXPECT_TRUE(controller.snap_animating());

    controller.on_draw_frame();
    clock.advance(301.0);
    controller.on_draw_frame();
    controller.on_draw_frame();

    EXPECT_EQ(controller.current_index(), 3);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_EQ(changes, std::vector<int>{3});
}

TEST_F(CurlControllerTest, SmoothJumpBackward) {
    controller.set_current_index(3);
    controller.on_draw_frame();

    controller.set_smooth_current_index(1);
    EXPECT_EQ(controller.curl_state(), CurlState::Left);
    EXPECT_TRUE(requested(1, 2));

    clock.advance(501.0);
    EXPECT_FALSE(controller.on_animation_frame());
    controller.on_draw_frame();
    clock.advance(301.0);
    controller.on_draw_frame();
    controller.on_draw_frame();

    EXPECT_EQ(controller.current_index(), 1);
    EXPECT_EQ(changes, (std::vector<int>{3, 1}));
}

TEST_F(CurlControllerTest, DragSettlesRunningJump) {
    controller.set_smooth_current_index(3);
    ASSERT_TRUE(controller.animator_running());

    controller.on_drag_start(180.0f, 50.0f);
    EXPECT_EQ(controller.current_index(), 3);
    EXPECT_EQ(controller.curl_state(), CurlState::Right);
    EXPECT_FALSE(controller.snap_animating());
}

TEST_F(CurlControllerTest, SameIndexIsNoOp) {
    size_t requests = provider.requests.size();
    int renders = render_requests;

    controller.set_current_index(0);
    EXPECT_EQ(provider.requests.size(), requests);
    EXPECT_EQ(render_requests, renders);

    controller.set_current_index(2);
    EXPECT_GT(provider.requests.size(), requests);
    EXPECT_GT(render_requests, renders);
}

TEST_F(CurlControllerTest, SmoothJumpToCurrentIndexOnlyRenders) {
    int renders = render_requests;
    controller.set_smooth_current_index(0);
    EXPECT_FALSE(controller.animator_running());
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_EQ(render_requests, renders + 1);
}

TEST_F(CurlControllerTest, NotifiesOnlyWhenIndexDiffers) {
    controller.set_current_index(2);
    controller.set_current_index(0);
    controller.on_draw_frame();
    EXPECT_TRUE(changes.empty());

    controller.set_current_index(4);
    controller.on_draw_frame();
    controller.on_draw_frame();
    EXPECT_EQ(changes, std::vector<int>{4});
}

TEST_F(CurlControllerTest, SingleTapReportsCurrentPage) {
    std::vector<int> clicks;
    controller.set_page_click_callback([&clicks](int index) { clicks.push_back(index); });
    controller.set_current_index(2);
    controller.on_single_tap(100.0f, 50.0f);
    EXPECT_EQ(clicks, std::vector<int>{2});
}

TEST_F(CurlControllerTest, DragMovesRequestRenders) {
    controller.on_drag_start(180.0f, 50.0f);
    int renders = render_requests;
    controller.on_drag_move(120.0f, 40.0f);
    EXPECT_GT(render_requests, renders);
}

TEST_F(CurlControllerTest, MeshConfigLockedWhileAttached) {
    ControllerConfig changed;
    changed.mesh.max_curl_splits = 4;
    EXPECT_THROW(controller.set_config(changed), std::logic_error);

    ControllerConfig timing;
    timing.animation_duration_ms = 100.0;
    EXPECT_NO_THROW(controller.set_config(timing));
    EXPECT_DOUBLE_EQ(controller.config().animation_duration_ms, 100.0);
}

TEST_F(CurlControllerTest, SurfaceCreatedRepopulates) {
    size_t requests = provider.requests.size();
    controller.on_surface_created();
    EXPECT_EQ(provider.requests.size(), requests + 1);
}

TEST_F(CurlControllerTest, ViewModeSetsLeftFlip) {
    controller.set_view_mode(ViewMode::TwoPages);
    EXPECT_FALSE(controller.mesh(MeshRole::Left).flip_texture());
    EXPECT_EQ(controller.page_bitmap_width(), 100);

    controller.set_view_mode(ViewMode::OnePage);
    EXPECT_TRUE(controller.mesh(MeshRole::Left).flip_texture());
    EXPECT_EQ(controller.page_bitmap_width(), 200);
}

// ============================================
// Curl pose
// ============================================

TEST_F(CurlControllerTest, FixedPressureSetsRadius) {
    controller.on_drag_start(195.0f, 50.0f);
    // Pressure is ignored unless enabled, the page is 4 wide
    controller.on_drag_move(100.0f, 50.0f, 1.0f);
    EXPECT_NEAR(controller.curl_radius(), 4.0 / 3.0 * 0.2, 1e-5);
    EXPECT_NEAR(controller.curl_position().x, 0.0f, 1e-5f);
    EXPECT_NEAR(controller.curl_direction().x, -1.0f, 1e-6f);
    EXPECT_NEAR(controller.curl_direction().y, 0.0f, 1e-6f);
}

TEST_F(CurlControllerTest, RadiusNeverNegativeOnLongDrag) {
    controller.on_drag_start(195.0f, 50.0f);
    controller.on_drag_move(-400.0f, 50.0f);

    EXPECT_GE(controller.curl_radius(), 0.0);
    EXPECT_DOUBLE_EQ(controller.curl_radius(), 0.0);
    // Held against the spine
    EXPECT_FLOAT_EQ(controller.curl_position().x, -2.0f);
}

TEST_F(CurlControllerTest, CurlPastTrailingEdgeFlattens) {
    controller.on_drag_start(195.0f, 50.0f);
    controller.on_drag_move(100.0f, 50.0f);
    EXPECT_GT(controller.mesh(MeshRole::Curl).back_count(), 0);

    controller.on_drag_move(250.0f, 50.0f);
    const PageMesh& curl = controller.mesh(MeshRole::Curl);
    EXPECT_EQ(curl.front_count(), 4);
    EXPECT_EQ(curl.back_count(), 0);
    EXPECT_EQ(curl.drop_shadow_count(), 0);
    EXPECT_EQ(curl.self_shadow_count(), 0);
}

TEST_F(CurlControllerTest, SteepDragPivotsAroundTopCorner) {
    controller.on_drag_start(195.0f, 50.0f);
    controller.on_drag_move(100.0f, 400.0f);

    // Curl axis runs through the spine's top corner
    Vec2 corner(-2.0f, 1.0f);
    Vec2 dir = controller.curl_direction();
    EXPECT_NEAR(dir.length(), 1.0f, 1e-5f);
    EXPECT_NEAR(dir.dot(controller.curl_position() - corner), 0.0f, 1e-4f);
    EXPECT_LT(dir.x, dir.y);
}

TEST_F(CurlControllerTest, SteepDragPivotsAroundBottomCorner) {
    controller.on_drag_start(195.0f, 50.0f);
    controller.on_drag_move(100.0f, -300.0f);

    Vec2 corner(-2.0f, -1.0f);
    Vec2 dir = controller.curl_direction();
    EXPECT_NEAR(dir.length(), 1.0f, 1e-5f);
    EXPECT_NEAR(dir.dot(controller.curl_position() - corner), 0.0f, 1e-4f);
    EXPECT_GT(dir.y, 0.0f);
}

TEST_F(CurlControllerTest, DirectionStaysUnitLength) {
    auto sweep = [this]() {
        for (float x : {150.0f, 100.0f, 20.0f, -50.0f, 260.0f}) {
            for (float y : {-300.0f, 10.0f, 50.0f, 90.0f, 400.0f}) {
                controller.on_drag_move(x, y);
                EXPECT_NEAR(controller.curl_direction().length(), 1.0f, 1e-5f)
                    << "at " << x << ", " << y;
                EXPECT_GE(controller.curl_radius(), 0.0);
                EXPECT_TRUE(std::isfinite(controller.curl_position().x));
                EXPECT_TRUE(std::isfinite(controller.curl_position().y));
            }
        }
    };

    controller.on_drag_start(195.0f, 50.0f);
    ASSERT_EQ(controller.curl_state(), CurlState::Right);
    sweep();
    controller.on_drag_end(150.0f, 50.0f);
    clock.advance(301.0);
    controller.on_draw_frame();

    controller.set_current_index(2);
    controller.on_drag_start(10.0f, 50.0f);
    ASSERT_EQ(controller.curl_state(), CurlState::Left);
    sweep();
}

TEST(CurlControllerPressureTest, PressureShrinksRadius) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.enable_touch_pressure = true;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    controller.on_drag_start(195.0f, 50.0f, 0.0f);
    controller.on_drag_move(100.0f, 50.0f, 0.5f);
    EXPECT_NEAR(controller.curl_radius(), 4.0 / 3.0 * 0.5, 1e-5);

    controller.on_drag_move(100.0f, 50.0f, 1.0f);
    EXPECT_DOUBLE_EQ(controller.curl_radius(), 0.0);

    controller.on_drag_move(100.0f, 50.0f, 1.5f);
    EXPECT_DOUBLE_EQ(controller.curl_radius(), 0.0);
}

TEST(CurlControllerTwoPageTest, RadiusNeverNegativeOnLongDrag) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.view_mode = ViewMode::TwoPages;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    controller.on_drag_start(195.0f, 50.0f);
    for (float x : {100.0f, 0.0f, -400.0f, -2000.0f}) {
        controller.on_drag_move(x, 50.0f);
        EXPECT_GE(controller.curl_radius(), 0.0);
    }
}

// ============================================
// Configuration
// ============================================

TEST(CurlControllerConfigTest, RejectsInvalidConfig) {
    ControllerConfig negative;
    negative.animation_duration_ms = -1.0;
    EXPECT_THROW(CurlController{negative}, std::invalid_argument);

    ControllerConfig splits;
    splits.mesh.max_curl_splits = 0;
    EXPECT_THROW(CurlController{splits}, std::invalid_argument);

    CurlController controller;
    ControllerConfig jump;
    jump.page_jump_duration_ms = -5.0;
    EXPECT_THROW(controller.set_config(jump), std::invalid_argument);
}

TEST(CurlControllerConfigTest, RebuildsMeshesWithoutProvider) {
    CurlController controller;
    ControllerConfig config;
    config.mesh.max_curl_splits = 4;
    controller.set_config(config);
    EXPECT_EQ(controller.mesh(MeshRole::Curl).max_curl_splits(), 4);
    EXPECT_EQ(controller.mesh(MeshRole::Left).max_curl_splits(), 4);
}

TEST(CurlControllerConfigTest, RebuildRetiresMeshIds) {
    CurlController controller;
    uint64_t old_curl = controller.mesh(MeshRole::Curl).id();
    uint64_t old_left = controller.mesh(MeshRole::Left).id();
    EXPECT_TRUE(controller.owns_mesh(old_curl));

    ControllerConfig config;
    config.mesh.max_curl_splits = 4;
    controller.set_config(config);
    EXPECT_FALSE(controller.owns_mesh(old_curl));
    EXPECT_FALSE(controller.owns_mesh(old_left));
    EXPECT_TRUE(controller.owns_mesh(controller.mesh(MeshRole::Curl).id()));
    EXPECT_TRUE(controller.owns_mesh(controller.mesh(MeshRole::Right).id()));

    // Other settings keep the meshes
    uint64_t kept = controller.mesh(MeshRole::Right).id();
    ControllerConfig timing = config;
    timing.animation_duration_ms = 50.0;
    controller.set_config(timing);
    EXPECT_TRUE(controller.owns_mesh(kept));
}

TEST(CurlControllerConfigTest, LastPageCurlDisallowed) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.allow_last_page_curl = false;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    controller.set_current_index(10);
    EXPECT_EQ(controller.current_index(), 4);

    controller.on_drag_start(180.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
}

TEST(CurlControllerConfigTest, DragIgnoredWithoutLayout) {
    FakePageProvider provider(5);
    CurlController controller;
    controller.set_page_provider(&provider);

    controller.on_drag_start(180.0f, 50.0f);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
    EXPECT_TRUE(provider.requests.empty());
}

// ============================================
// Two page mode
// ============================================

TEST(CurlControllerTwoPageTest, DrawsBothPages) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.view_mode = ViewMode::TwoPages;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    EXPECT_EQ(controller.page_bitmap_width(), 100);
    controller.set_current_index(2);
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Left));
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Right));
}

TEST(CurlControllerTwoPageTest, LeftPageHiddenWhenDisabled) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.view_mode = ViewMode::TwoPages;
    config.render_left_page = false;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    controller.set_current_index(2);
    EXPECT_FALSE(controller.in_draw_list(MeshRole::Left));
    EXPECT_TRUE(controller.in_draw_list(MeshRole::Right));
}

TEST(CurlControllerTwoPageTest, DragAcrossSpineTurnsPage) {
    FakeClock clock;
    FakePageProvider provider(5);
    ControllerConfig config;
    config.view_mode = ViewMode::TwoPages;
    CurlController controller(config, clock.function());
    attach(controller, provider);

    drag(controller, clock, 190.0f, 10.0f);
    EXPECT_EQ(controller.current_index(), 1);
    EXPECT_EQ(controller.curl_state(), CurlState::None);
}
