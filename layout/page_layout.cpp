#include "page_layout.hpp"
#include "logging.hpp"

namespace pagecurl {

bool PageLayout::set_viewport(int width, int height) {
    if (width <= 0 || height <= 0) {
        logging::get_logger()->debug("PageLayout: ignoring empty viewport {}x{}", width, height);
        return false;
    }

    viewport_width_ = width;
    viewport_height_ = height;

    float ratio = static_cast<float>(width) / static_cast<float>(height);
    view_rect_ = RectF(-ratio, 1.0f, ratio, -1.0f);

    return update_page_rects();
}

bool PageLayout::set_margins(int left, int top, int right, int bottom) {
    if (viewport_width_ <= 0 || viewport_height_ <= 0) {
        logging::get_logger()->debug("PageLayout: pixel margins set before viewport, ignored");
        return false;
    }

    auto w = static_cast<float>(viewport_width_);
    auto h = static_cast<float>(viewport_height_);
    return set_proportional_margins(left / w, top / h, right / w, bottom / h);
}

bool PageLayout::set_proportional_margins(float left, float top, float right, float bottom) {
    return set_proportional_margins(LayoutMargins{left, top, right, bottom});
}

bool PageLayout::set_proportional_margins(const LayoutMargins& margins) {
    margins_ = margins;
    return update_page_rects();
}

bool PageLayout::set_view_mode(ViewMode mode) {
    view_mode_ = mode;
    return update_page_rects();
}

bool PageLayout::valid() const {
    return !view_rect_.empty();
}

std::optional<RectF> PageLayout::page_rect(PageSlot slot) const {
    if (!valid()) {
        return std::nullopt;
    }
    return slot == PageSlot::Left ? page_rect_left_ : page_rect_right_;
}

Vec2 PageLayout::translate(const Vec2& pixel) const {
    if (viewport_width_ <= 0 || viewport_height_ <= 0) {
        return pixel;
    }
    return {
        view_rect_.left + (view_rect_.width() * pixel.x / static_cast<float>(viewport_width_)),
        view_rect_.top + (view_rect_.height() * pixel.y / static_cast<float>(viewport_height_))
    };
}

float PageLayout::inverse_translate_x(float x) const {
    if (view_rect_.width() == 0.0f) {
        return x;
    }
    return static_cast<float>(viewport_width_) * (x - view_rect_.left) / view_rect_.width();
}

float PageLayout::inverse_translate_y(float y) const {
    if (view_rect_.height() == 0.0f) {
        return y;
    }
    return static_cast<float>(viewport_height_) * (y - view_rect_.top) / view_rect_.height();
}

std::pair<int, int> PageLayout::page_bitmap_size() const {
    if (!valid()) {
        return {0, 0};
    }
    int w = static_cast<int>((page_rect_right_.width() * static_cast<float>(viewport_width_)) /
                             view_rect_.width());
    int h = static_cast<int>((page_rect_right_.height() * static_cast<float>(viewport_height_)) /
                             view_rect_.height());
    return {w, h};
}

bool PageLayout::update_page_rects() {
    if (!valid()) {
        return false;
    }

    RectF previous_left = page_rect_left_;
    RectF previous_right = page_rect_right_;

    RectF inset = view_rect_;
    inset.left += view_rect_.width() * margins_.left;
    inset.right -= view_rect_.width() * margins_.right;
    inset.top += view_rect_.height() * margins_.top;
    inset.bottom -= view_rect_.height() * margins_.bottom;

    if (view_mode_ == ViewMode::OnePage) {
        page_rect_right_ = inset;
        page_rect_left_ = inset;
        page_rect_left_.offset(-inset.width(), 0.0f);
    } else {
        page_rect_left_ = inset;
        page_rect_left_.right = (inset.left + inset.right) / 2.0f;
        page_rect_right_ = inset;
        page_rect_right_.left = page_rect_left_.right;
    }

    return previous_left != page_rect_left_ || previous_right != page_rect_right_;
}

}  // namespace pagecurl
