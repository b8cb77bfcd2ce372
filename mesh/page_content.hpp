#ifndef PAGECURL_MESH_PAGE_CONTENT_HPP
#define PAGECURL_MESH_PAGE_CONTENT_HPP

#include <geometry/color.hpp>
#include <geometry/rect.hpp>
#include <memory>
#include <vector>

namespace pagecurl {

enum class PageSide {
    Front,
    Back,
    Both
};

// Row-major ARGB raster
struct Image {
    int width = 0;
    int height = 0;
    std::vector<Argb> pixels;

    Image() = default;
    Image(int w, int h, Argb fill = color::TRANSPARENT);

    bool empty() const { return width <= 0 || height <= 0; }

    Argb at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    void set(int x, int y, Argb c) { pixels[static_cast<size_t>(y) * width + x] = c; }
};

using ImagePtr = std::shared_ptr<const Image>;

// Smallest power of two that is >= n (n >= 1)
int next_power_of_two(int n);

// Front/back imagery and tint colors of a single page mesh.
//
// Images are shared, not copied; setting the same image on both sides makes
// has_back_texture() false.
class PageContent {
public:
    PageContent();

    Argb color(PageSide side) const;
    void set_color(Argb color, PageSide side);

    // A null image is replaced by a 1x1 image of the side's color
    void set_texture(ImagePtr image, PageSide side);

    const ImagePtr& image(PageSide side) const;

    // Copy of the side's image padded to power-of-two dimensions. The valid
    // region is written to texture_rect as (0, 0, w/newW, h/newH).
    ImagePtr texture(RectF& texture_rect, PageSide side) const;

    // Replaces both images with 1x1 images of the current colors
    void recycle();

    // White colors and recycled images
    void reset();

    bool textures_changed() const { return textures_changed_; }
    bool has_back_texture() const { return front_image_ != back_image_; }

private:
    Argb front_color_ = color::WHITE;
    Argb back_color_ = color::WHITE;
    ImagePtr front_image_;
    ImagePtr back_image_;
    bool textures_changed_ = false;
};

}  // namespace pagecurl

#endif // PAGECURL_MESH_PAGE_CONTENT_HPP
