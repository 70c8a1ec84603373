#pragma once

#include <fivenav/easing.hpp>
#include <fivenav/types.hpp>
#include <functional>
#include <optional>

#include "anim/progress_animation.hpp"

namespace fivenav
{

// Reverse drag on an active peripheral region. Single axis, single
// direction: the drag must start in the band along the edge facing Center
// and move toward Center. Progress is independent of the outer session and
// commits at a fixed halfway threshold.
class PeripheralSwipeBackSession
{
   public:
    static constexpr float COMMIT_THRESHOLD = 0.5f;
    // At or above this the session counts as in flight even when idle, so
    // a platform back signal does not start a second return.
    static constexpr float IN_FLIGHT_PROGRESS = 0.1f;

    enum class State
    {
        Idle,
        Dragging,
        CommittingForward,
        CommittingBack,
        Committed,
    };

    enum class Outcome
    {
        None,
        Committed,
        Cancelled,
    };

    using HapticCallback = std::function<void()>;

    PeripheralSwipeBackSession(Region     region,
                               float      edge_fraction,
                               Size2      viewport,
                               float      duration,
                               EasingFunc easing);

    void set_haptic_callback(HapticCallback cb) { on_haptic_ = std::move(cb); }
    void set_viewport(Size2 viewport) { viewport_ = viewport; }

    // True if a drag starting at pos may become a swipe-back.
    bool accepts_start(Vec2 pos) const;

    // Returns true when the press starts a swipe-back drag.
    bool pointer_down(Vec2 pos);
    void pointer_move(Vec2 pos);
    void pointer_up(double now);
    void pointer_cancel(double now);

    // Drops any drag or settle in progress without reporting an outcome.
    void abort();

    // Advances the settle animation. Reports Committed or Cancelled exactly
    // once, on the call that finishes it.
    Outcome update(double now);

    Region    region() const { return region_; }
    Direction return_direction() const { return return_dir_; }
    State     state() const { return state_; }
    float     progress() const { return progress_; }

    bool is_dragging() const { return state_ == State::Dragging; }
    bool is_animating() const
    {
        return state_ == State::CommittingForward || state_ == State::CommittingBack;
    }
    bool in_flight() const
    {
        return is_dragging() || is_animating() || state_ == State::Committed
               || progress_ >= IN_FLIGHT_PROGRESS;
    }

   private:
    float   axis_extent() const;
    void    start_settle(float target, double now);
    Outcome finish(float value);

    Region     region_;
    Direction  return_dir_;
    float      edge_fraction_;
    Size2      viewport_;
    float      duration_;
    EasingFunc easing_;

    State state_        = State::Idle;
    Vec2  start_        = {};
    float progress_     = 0.0f;
    bool  haptic_armed_ = true;

    std::optional<ProgressAnimation> anim_;
    HapticCallback                   on_haptic_;
};

}   // namespace fivenav
