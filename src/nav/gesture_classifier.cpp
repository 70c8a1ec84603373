#include "gesture_classifier.hpp"

#include <cmath>
#include <fivenav/logger.hpp>

namespace fivenav
{

GestureClassifier::GestureClassifier(const DetectionZone& zone,
                                     Size2                viewport,
                                     const RegionMask&    present)
    : zone_(zone), viewport_(viewport), present_(present)
{
}

void GestureClassifier::begin(Vec2 origin)
{
    state_      = State::Unlocked;
    origin_     = origin;
    cumulative_ = {};
    direction_.reset();
}

void GestureClassifier::reset()
{
    state_      = State::Idle;
    origin_     = {};
    cumulative_ = {};
    direction_.reset();
}

GestureClassifier::Step GestureClassifier::feed(Vec2 delta)
{
    Step step;
    if (state_ == State::Idle || state_ == State::Inert)
        return step;

    cumulative_ = cumulative_ + delta;

    if (state_ == State::Locked)
    {
        step.direction  = direction_;
        step.axis_delta = axis_of(*direction_) == Axis::Horizontal ? delta.x : delta.y;
        return step;
    }

    if (std::fabs(cumulative_.x) <= LOCK_THRESHOLD_PX && std::fabs(cumulative_.y) <= LOCK_THRESHOLD_PX)
        return step;

    auto dir = classify();
    if (!dir)
    {
        state_ = State::Inert;
        FIVENAV_LOG_DEBUG("classifier",
                          "Gesture from ({}, {}) inert after ({}, {})",
                          origin_.x,
                          origin_.y,
                          cumulative_.x,
                          cumulative_.y);
        return step;
    }

    state_     = State::Locked;
    direction_ = dir;

    step.direction   = dir;
    step.just_locked = true;
    step.axis_delta  = axis_of(*dir) == Axis::Horizontal ? cumulative_.x : cumulative_.y;
    FIVENAV_LOG_DEBUG("classifier", "Locked {} (reveals {})", to_string(*dir), to_string(revealed_region(*dir)));
    return step;
}

std::optional<Direction> GestureClassifier::classify() const
{
    const float dx = cumulative_.x;
    const float dy = cumulative_.y;

    // Ties go vertical.
    if (std::fabs(dx) > std::fabs(dy))
    {
        if (dx > 0.0f && origin_.x < zone_.horizontal_band_width && present(Region::Left))
            return Direction::Right;
        if (dx < 0.0f && origin_.x > viewport_.width - zone_.horizontal_band_width
            && present(Region::Right))
            return Direction::Left;
        return std::nullopt;
    }

    if (dy > 0.0f && origin_.y < zone_.vertical_band_height && present(Region::Top))
        return Direction::Down;
    if (dy < 0.0f && origin_.y > viewport_.height - zone_.vertical_band_height
        && present(Region::Bottom))
        return Direction::Up;
    return std::nullopt;
}

}   // namespace fivenav
