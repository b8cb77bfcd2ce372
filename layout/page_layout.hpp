#ifndef PAGECURL_LAYOUT_PAGE_LAYOUT_HPP
#define PAGECURL_LAYOUT_PAGE_LAYOUT_HPP

#include <geometry/rect.hpp>
#include <math/vec2.hpp>
#include <optional>
#include <utility>

namespace pagecurl {

enum class ViewMode {
    OnePage,   // right page fills the visible area
    TwoPages   // left and right pages side by side
};

enum class PageSlot {
    Left,
    Right
};

// Proportional margins, e.g. 0.1 is a 10% margin
struct LayoutMargins {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
};

// Maps viewport pixels to the normalized page space and computes the
// rectangle of each page slot.
//
// The normalized view rectangle spans [-aspect, aspect] horizontally and
// [1, -1] vertically (top to bottom).
class PageLayout {
public:
    PageLayout() = default;

    // Returns true if the page rectangles changed
    bool set_viewport(int width, int height);

    // Pixel margins, converted to proportional ones using the current viewport.
    // Ignored while the viewport is empty.
    bool set_margins(int left, int top, int right, int bottom);

    bool set_proportional_margins(float left, float top, float right, float bottom);
    bool set_proportional_margins(const LayoutMargins& margins);

    bool set_view_mode(ViewMode mode);

    ViewMode view_mode() const { return view_mode_; }
    const LayoutMargins& margins() const { return margins_; }
    int viewport_width() const { return viewport_width_; }
    int viewport_height() const { return viewport_height_; }
    const RectF& view_rect() const { return view_rect_; }

    // False until a non-empty viewport has been set
    bool valid() const;

    // Page rectangle for a slot, empty while the layout is not valid
    std::optional<RectF> page_rect(PageSlot slot) const;

    // Pixel position to normalized position
    Vec2 translate(const Vec2& pixel) const;

    float inverse_translate_x(float x) const;
    float inverse_translate_y(float y) const;

    // Size in pixels of one page (the right slot)
    std::pair<int, int> page_bitmap_size() const;

private:
    bool update_page_rects();

    ViewMode view_mode_ = ViewMode::OnePage;
    LayoutMargins margins_;
    int viewport_width_ = 0;
    int viewport_height_ = 0;
    RectF view_rect_;
    RectF page_rect_left_;
    RectF page_rect_right_;
};

}  // namespace pagecurl

#endif // PAGECURL_LAYOUT_PAGE_LAYOUT_HPP
