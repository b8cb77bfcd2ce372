#include "curl_animator.hpp"
#include <algorithm>
#include <utility>

namespace pagecurl {

float interpolate(Interpolator interpolator, float t) {
    switch (interpolator) {
        case Interpolator::Accelerate:
            return t * t;
        case Interpolator::Linear:
        default:
            return t;
    }
}

void CurlAnimator::start(float from, float to, double duration_ms, Interpolator interpolator,
                         double now_ms, UpdateFunction on_update, EndFunction on_end) {
    from_ = from;
    to_ = to;
    duration_ms_ = std::max(duration_ms, 0.0);
    start_ms_ = now_ms;
    interpolator_ = interpolator;
    on_update_ = std::move(on_update);
    on_end_ = std::move(on_end);
    running_ = true;
    ++generation_;
}

void CurlAnimator::cancel() {
    running_ = false;
    ++generation_;
    on_update_ = nullptr;
    on_end_ = nullptr;
}

bool CurlAnimator::tick(double now_ms) {
    if (!running_) {
        return false;
    }

    float fraction = 1.0f;
    if (duration_ms_ > 0.0) {
        fraction = static_cast<float>(std::clamp((now_ms - start_ms_) / duration_ms_, 0.0, 1.0));
    }

    float value = from_ + (to_ - from_) * interpolate(interpolator_, fraction);
    unsigned generation = generation_;
    UpdateFunction on_update = on_update_;
    if (on_update) {
        on_update(value);
    }

    // The update callback may have cancelled or restarted the animation
    if (generation != generation_ || fraction < 1.0f) {
        return running_;
    }

    running_ = false;
    EndFunction on_end = std::move(on_end_);
    on_end_ = nullptr;
    on_update_ = nullptr;
    if (on_end) {
        on_end();
    }
    return running_;
}

}  // namespace pagecurl
