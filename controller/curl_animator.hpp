#ifndef PAGECURL_CONTROLLER_CURL_ANIMATOR_HPP
#define PAGECURL_CONTROLLER_CURL_ANIMATOR_HPP

#include <functional>

namespace pagecurl {

enum class Interpolator {
    Linear,       // f(t) = t
    Accelerate    // f(t) = t^2
};

float interpolate(Interpolator interpolator, float t);

// Time driven scalar animation, advanced explicitly with tick().
//
// The end callback runs once after the final update, unless the animation is
// cancelled first. Callbacks may start a new animation on the same animator.
class CurlAnimator {
public:
    using UpdateFunction = std::function<void(float value)>;
    using EndFunction = std::function<void()>;

    void start(float from, float to, double duration_ms, Interpolator interpolator,
               double now_ms, UpdateFunction on_update, EndFunction on_end = {});

    void cancel();

    bool running() const { return running_; }

    // Advance to now_ms; returns true while the animation keeps running
    bool tick(double now_ms);

private:
    bool running_ = false;
    unsigned generation_ = 0;
    float from_ = 0.0f;
    float to_ = 0.0f;
    double duration_ms_ = 0.0;
    double start_ms_ = 0.0;
    Interpolator interpolator_ = Interpolator::Linear;
    UpdateFunction on_update_;
    EndFunction on_end_;
};

}  // namespace pagecurl

#endif // PAGECURL_CONTROLLER_CURL_ANIMATOR_HPP
