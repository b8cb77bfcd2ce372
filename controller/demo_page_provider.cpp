#include "demo_page_provider.hpp"
#include <algorithm>
#include <memory>

namespace pagecurl {

namespace {

// Background tints cycled by page index
constexpr Argb PAGE_TINTS[] = {
    color::rgb(0xFA, 0xF3, 0xE0),
    color::rgb(0xE3, 0xF2, 0xFD),
    color::rgb(0xE8, 0xF5, 0xE9),
    color::rgb(0xFC, 0xE4, 0xEC),
    color::rgb(0xFF, 0xF8, 0xE1),
};

constexpr Argb INK = color::rgb(0x37, 0x47, 0x4F);

}  // anonymous namespace

DemoPageProvider::DemoPageProvider(int page_count)
    : page_count_(std::max(page_count, 0)) {}

void DemoPageProvider::update_page(PageContent& content, int width, int height,
                                   int index, std::optional<int> back_index) {
    ImagePtr front = render_page(width, height, index);
    if (!back_index) {
        content.set_texture(front, PageSide::Both);
    } else {
        content.set_texture(front, PageSide::Front);
        content.set_texture(render_page(width, height, *back_index), PageSide::Back);
    }
    content.set_color(back_color, PageSide::Back);
}

ImagePtr DemoPageProvider::render_page(int width, int height, int index) const {
    int w = std::clamp(width, 1, max_image_size);
    int h = std::clamp(height, 1, max_image_size);

    constexpr int tint_count = static_cast<int>(sizeof(PAGE_TINTS) / sizeof(PAGE_TINTS[0]));
    Argb tint = PAGE_TINTS[((index % tint_count) + tint_count) % tint_count];
    auto image = std::make_shared<Image>(w, h, tint);

    // Frame
    int border = std::max(1, std::min(w, h) / 40);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (x < border || y < border || x >= w - border || y >= h - border) {
                image->set(x, y, INK);
            }
        }
    }

    // One bar per page number, stacked from the top
    int bars = std::max(index + 1, 0);
    int margin = border * 4;
    int bar_height = std::max(1, border * 2);
    int step = bar_height * 2;
    for (int b = 0; b < bars; ++b) {
        int top = margin + b * step;
        if (top + bar_height > h - margin) {
            break;
        }
        for (int y = top; y < top + bar_height; ++y) {
            for (int x = margin; x < w - margin; ++x) {
                image->set(x, y, INK);
            }
        }
    }

    return image;
}

}  // namespace pagecurl
