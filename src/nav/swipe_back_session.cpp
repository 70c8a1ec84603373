#include "swipe_back_session.hpp"

#include <algorithm>
#include <fivenav/logger.hpp>

namespace fivenav
{

namespace
{

Direction return_direction_for(Region region)
{
    // The region was revealed by some direction; going back is its opposite.
    auto reveal = direction_for_region(region);
    return reveal ? opposite(*reveal) : Direction::Left;
}

}   // anonymous namespace

PeripheralSwipeBackSession::PeripheralSwipeBackSession(Region     region,
                                                       float      edge_fraction,
                                                       Size2      viewport,
                                                       float      duration,
                                                       EasingFunc easing)
    : region_(region),
      return_dir_(return_direction_for(region)),
      edge_fraction_(std::clamp(edge_fraction, 0.0f, 1.0f)),
      viewport_(viewport),
      duration_(duration),
      easing_(std::move(easing))
{
}

float PeripheralSwipeBackSession::axis_extent() const
{
    return axis_of(return_dir_) == Axis::Horizontal ? viewport_.width : viewport_.height;
}

bool PeripheralSwipeBackSession::accepts_start(Vec2 pos) const
{
    if (viewport_.empty())
        return false;

    const float hband = viewport_.width * edge_fraction_;
    const float vband = viewport_.height * edge_fraction_;

    switch (region_)
    {
        case Region::Left:
            return pos.x >= viewport_.width - hband;
        case Region::Right:
            return pos.x <= hband;
        case Region::Top:
            return pos.y >= viewport_.height - vband;
        case Region::Bottom:
            return pos.y <= vband;
        case Region::Center:
            break;
    }
    return false;
}

bool PeripheralSwipeBackSession::pointer_down(Vec2 pos)
{
    if (state_ != State::Idle || !accepts_start(pos))
        return false;

    state_        = State::Dragging;
    start_        = pos;
    progress_     = 0.0f;
    haptic_armed_ = true;
    FIVENAV_LOG_DEBUG("swipe_back", "Drag started on {} at ({}, {})", to_string(region_), pos.x, pos.y);
    return true;
}

void PeripheralSwipeBackSession::pointer_move(Vec2 pos)
{
    if (state_ != State::Dragging)
        return;

    const float extent = axis_extent();
    if (extent <= 0.0f)
        return;

    Vec2  d     = pos - start_;
    float along = axis_of(return_dir_) == Axis::Horizontal ? d.x : d.y;
    along *= direction_sign(return_dir_);
    progress_ = std::clamp(along / extent, 0.0f, 1.0f);

    if (progress_ >= COMMIT_THRESHOLD && haptic_armed_)
    {
        haptic_armed_ = false;
        if (on_haptic_)
            on_haptic_();
    }
    else if (progress_ < COMMIT_THRESHOLD)
    {
        haptic_armed_ = true;
    }
}

void PeripheralSwipeBackSession::pointer_up(double now)
{
    if (state_ != State::Dragging)
        return;
    start_settle(progress_ >= COMMIT_THRESHOLD ? 1.0f : 0.0f, now);
}

void PeripheralSwipeBackSession::pointer_cancel(double now)
{
    if (state_ != State::Dragging)
        return;
    start_settle(0.0f, now);
}

void PeripheralSwipeBackSession::abort()
{
    anim_.reset();
    state_        = State::Idle;
    progress_     = 0.0f;
    haptic_armed_ = true;
}

void PeripheralSwipeBackSession::start_settle(float target, double now)
{
    if (target <= 0.0f && progress_ <= 0.0f)
    {
        abort();
        return;
    }
    haptic_armed_ = true;
    state_        = target >= 1.0f ? State::CommittingForward : State::CommittingBack;
    anim_.emplace(progress_, target, now, duration_, easing_);
    FIVENAV_LOG_DEBUG("swipe_back",
                      "{} released at {}, settling to {}",
                      to_string(region_),
                      progress_,
                      target);
}

PeripheralSwipeBackSession::Outcome PeripheralSwipeBackSession::update(double now)
{
    if (!is_animating() || !anim_)
        return Outcome::None;

    try
    {
        progress_ = anim_->value_at(now);
    }
    catch (const std::exception& e)
    {
        FIVENAV_LOG_WARN("swipe_back", "Settle animation failed on {}: {}", to_string(region_), e.what());
        return finish(progress_ >= 0.5f ? 1.0f : 0.0f);
    }

    if (!anim_->finished_at(now))
        return Outcome::None;
    return finish(anim_->to());
}

PeripheralSwipeBackSession::Outcome PeripheralSwipeBackSession::finish(float value)
{
    anim_.reset();
    if (value >= 1.0f)
    {
        progress_ = 1.0f;
        state_    = State::Committed;
        FIVENAV_LOG_DEBUG("swipe_back", "{} committed", to_string(region_));
        return Outcome::Committed;
    }

    progress_ = 0.0f;
    state_    = State::Idle;
    return Outcome::Cancelled;
}

}   // namespace fivenav
