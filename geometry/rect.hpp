#ifndef PAGECURL_GEOMETRY_RECT_HPP
#define PAGECURL_GEOMETRY_RECT_HPP

#include <math/vec2.hpp>

namespace pagecurl {

// Axis-aligned rectangle given by its four edges.
// Normalized page space is y-up, so page rectangles have top > bottom and
// therefore a negative height().
struct RectF {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    constexpr RectF() = default;
    constexpr RectF(float left_, float top_, float right_, float bottom_)
        : left(left_), top(top_), right(right_), bottom(bottom_) {}

    constexpr float width() const { return right - left; }
    constexpr float height() const { return bottom - top; }

    constexpr float center_x() const { return (left + right) * 0.5f; }
    constexpr float center_y() const { return (top + bottom) * 0.5f; }

    constexpr Vec2 center() const { return {center_x(), center_y()}; }

    constexpr bool empty() const {
        return width() == 0.0f || height() == 0.0f;
    }

    constexpr void offset(float dx, float dy) {
        left += dx;
        right += dx;
        top += dy;
        bottom += dy;
    }

    constexpr bool operator==(const RectF& other) const {
        return left == other.left && top == other.top &&
               right == other.right && bottom == other.bottom;
    }

    constexpr bool operator!=(const RectF& other) const {
        return !(*this == other);
    }
};

}  // namespace pagecurl

#endif // PAGECURL_GEOMETRY_RECT_HPP
