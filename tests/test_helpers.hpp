#ifndef PAGECURL_TEST_HELPERS_HPP
#define PAGECURL_TEST_HELPERS_HPP

#include <controller/curl_controller.hpp>
#include <mesh/page_content.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace pagecurl {
namespace test {

// Provider that records every request and fills pages with a solid color
class FakePageProvider : public PageProvider {
public:
    struct Request {
        int index;
        std::optional<int> back_index;
        int width;
        int height;
    };

    explicit FakePageProvider(int count) : count_(count) {}

    int page_count() const override { return count_; }

    void update_page(PageContent& content, int width, int height,
                     int index, std::optional<int> back_index) override {
        requests.push_back({index, back_index, width, height});
        auto image = std::make_shared<const Image>(4, 4, color::rgb(0x10, 0x20, 0x30));
        content.set_texture(image, PageSide::Both);
    }

    std::vector<Request> requests;

private:
    int count_;
};

// Manually advanced time source
struct FakeClock {
    double now_ms = 1000.0;

    ClockFunction function() {
        return [this]() { return now_ms; };
    }

    void advance(double ms) { now_ms += ms; }
};

// 200x100 viewport: normalized view is [-2, 2] x [1, -1] and, in one page
// mode, the right page covers all of it.
constexpr int VIEW_WIDTH = 200;
constexpr int VIEW_HEIGHT = 100;

inline void attach(CurlController& controller, FakePageProvider& provider) {
    controller.set_viewport(VIEW_WIDTH, VIEW_HEIGHT);
    controller.set_page_provider(&provider);
}

// Press, move and release with the snap animation run to completion
inline void drag(CurlController& controller, FakeClock& clock,
                 float from_x, float to_x, float y = 50.0f) {
    controller.on_drag_start(from_x, y);
    controller.on_drag_move((from_x + to_x) / 2.0f, y);
    controller.on_drag_move(to_x, y);
    controller.on_drag_end(to_x, y);
    controller.on_draw_frame();
    clock.advance(controller.config().animation_duration_ms + 1.0);
    controller.on_draw_frame();
}

}  // namespace test
}  // namespace pagecurl

#endif // PAGECURL_TEST_HELPERS_HPP
