#include "page_content.hpp"
#include <algorithm>

namespace pagecurl {

Image::Image(int w, int h, Argb fill)
    : width(w), height(h),
      pixels(static_cast<size_t>(std::max(w, 0)) * static_cast<size_t>(std::max(h, 0)), fill) {}

int next_power_of_two(int n) {
    if (n <= 1) {
        return 1;
    }
    unsigned int v = static_cast<unsigned int>(n) - 1;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    return static_cast<int>(v + 1);
}

namespace {

ImagePtr solid_image(Argb c) {
    return std::make_shared<const Image>(1, 1, c);
}

}  // anonymous namespace

PageContent::PageContent() {
    reset();
}

Argb PageContent::color(PageSide side) const {
    return side == PageSide::Front ? front_color_ : back_color_;
}

void PageContent::set_color(Argb c, PageSide side) {
    switch (side) {
        case PageSide::Front:
            front_color_ = c;
            break;
        case PageSide::Back:
            back_color_ = c;
            break;
        case PageSide::Both:
            front_color_ = c;
            back_color_ = c;
            break;
    }
}

void PageContent::set_texture(ImagePtr image, PageSide side) {
    if (!image) {
        image = solid_image(side == PageSide::Back ? back_color_ : front_color_);
    }

    switch (side) {
        case PageSide::Front:
            front_image_ = std::move(image);
            break;
        case PageSide::Back:
            back_image_ = std::move(image);
            break;
        case PageSide::Both:
            front_image_ = image;
            back_image_ = std::move(image);
            break;
    }
    textures_changed_ = true;
}

const ImagePtr& PageContent::image(PageSide side) const {
    return side == PageSide::Front ? front_image_ : back_image_;
}

ImagePtr PageContent::texture(RectF& texture_rect, PageSide side) const {
    const ImagePtr& source = image(side);
    if (!source || source->empty()) {
        return nullptr;
    }

    int w = source->width;
    int h = source->height;
    int new_w = next_power_of_two(w);
    int new_h = next_power_of_two(h);

    auto padded = std::make_shared<Image>(new_w, new_h, color::TRANSPARENT);
    for (int y = 0; y < h; ++y) {
        std::copy_n(source->pixels.begin() + static_cast<std::ptrdiff_t>(y) * w, w,
                    padded->pixels.begin() + static_cast<std::ptrdiff_t>(y) * new_w);
    }

    texture_rect = RectF(0.0f, 0.0f,
                         static_cast<float>(w) / static_cast<float>(new_w),
                         static_cast<float>(h) / static_cast<float>(new_h));
    return padded;
}

void PageContent::recycle() {
    front_image_ = solid_image(front_color_);
    back_image_ = solid_image(back_color_);
    textures_changed_ = false;
}

void PageContent::reset() {
    front_color_ = color::WHITE;
    back_color_ = color::WHITE;
    recycle();
}

}  // namespace pagecurl
