#include "progress_animation.hpp"

#include <algorithm>

namespace fivenav
{

ProgressAnimation::ProgressAnimation(float      from,
                                     float      to,
                                     double     start_time,
                                     float      duration,
                                     EasingFunc easing)
    : from_(from),
      to_(to),
      start_time_(start_time),
      duration_(duration > 0.0f ? duration : 0.0f),
      easing_(std::move(easing))
{
}

float ProgressAnimation::fraction_at(double now) const
{
    if (duration_ <= 0.0f)
        return 1.0f;
    double t = (now - start_time_) / static_cast<double>(duration_);
    return static_cast<float>(std::clamp(t, 0.0, 1.0));
}

float ProgressAnimation::value_at(double now) const
{
    float t = fraction_at(now);
    if (t >= 1.0f)
        return std::clamp(to_, 0.0f, 1.0f);

    float eased = easing_ ? easing_(t) : t;
    float v     = from_ + (to_ - from_) * eased;
    return std::clamp(v, 0.0f, 1.0f);
}

bool ProgressAnimation::finished_at(double now) const
{
    return fraction_at(now) >= 1.0f;
}

}   // namespace fivenav
