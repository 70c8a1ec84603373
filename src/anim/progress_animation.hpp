#pragma once

#include <fivenav/easing.hpp>

namespace fivenav
{

// A single progress animation described by value rather than by a ticking
// object: the value at any instant is computed from the start time, so the
// owner only needs to know what time it is.
//
// Sampled values are clamped into [0,1] even when the easing overshoots.
// value_at() lets exceptions from a user-supplied easing propagate; the
// owning state machine decides how to recover.
class ProgressAnimation
{
   public:
    ProgressAnimation(float from, float to, double start_time, float duration, EasingFunc easing);

    float  from() const { return from_; }
    float  to() const { return to_; }
    double start_time() const { return start_time_; }
    float  duration() const { return duration_; }

    void set_start_time(double t) { start_time_ = t; }

    // Normalized elapsed time in [0,1].
    float fraction_at(double now) const;

    float value_at(double now) const;
    bool  finished_at(double now) const;

   private:
    float      from_;
    float      to_;
    double     start_time_;
    float      duration_;
    EasingFunc easing_;
};

}   // namespace fivenav
