#ifndef PAGECURL_CONTROLLER_DEMO_PAGE_PROVIDER_HPP
#define PAGECURL_CONTROLLER_DEMO_PAGE_PROVIDER_HPP

#include "curl_controller.hpp"
#include <geometry/color.hpp>
#include <mesh/page_content.hpp>

namespace pagecurl {

// Procedural pages for the viewer: a tinted background, a frame and one bar
// per page number, so page order is visible without any image files.
class DemoPageProvider : public PageProvider {
public:
    explicit DemoPageProvider(int page_count = 10);

    int page_count() const override { return page_count_; }

    void update_page(PageContent& content, int width, int height,
                     int index, std::optional<int> back_index) override;

    // Page image at the given size, no larger than max_image_size per side
    ImagePtr render_page(int width, int height, int index) const;

    int max_image_size = 1024;

    // Back side tint, semi transparent so the reverse reads as see-through paper
    Argb back_color = color::argb(0xC0, 0xFF, 0xFF, 0xFF);

private:
    int page_count_;
};

}  // namespace pagecurl

#endif // PAGECURL_CONTROLLER_DEMO_PAGE_PROVIDER_HPP
