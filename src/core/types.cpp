#include <algorithm>
#include <cmath>
#include <fivenav/types.hpp>

namespace fivenav
{

uint32_t Color::to_argb() const
{
    auto channel = [](float v) -> uint32_t
    { return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };
    return (channel(a) << 24) | (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

Region revealed_region(Direction d)
{
    switch (d)
    {
        case Direction::Left:
            return Region::Right;
        case Direction::Right:
            return Region::Left;
        case Direction::Up:
            return Region::Bottom;
        case Direction::Down:
            return Region::Top;
    }
    return Region::Center;
}

std::optional<Direction> direction_for_region(Region r)
{
    switch (r)
    {
        case Region::Left:
            return Direction::Right;
        case Region::Right:
            return Direction::Left;
        case Region::Top:
            return Direction::Down;
        case Region::Bottom:
            return Direction::Up;
        case Region::Center:
            break;
    }
    return std::nullopt;
}

Direction opposite(Direction d)
{
    switch (d)
    {
        case Direction::Left:
            return Direction::Right;
        case Direction::Right:
            return Direction::Left;
        case Direction::Up:
            return Direction::Down;
        case Direction::Down:
            return Direction::Up;
    }
    return d;
}

Axis axis_of(Direction d)
{
    return (d == Direction::Left || d == Direction::Right) ? Axis::Horizontal : Axis::Vertical;
}

float direction_sign(Direction d)
{
    return (d == Direction::Left || d == Direction::Up) ? -1.0f : 1.0f;
}

bool is_peripheral(Region r)
{
    return r != Region::Center;
}

std::string_view to_string(Region r)
{
    switch (r)
    {
        case Region::Center:
            return "Center";
        case Region::Left:
            return "Left";
        case Region::Right:
            return "Right";
        case Region::Top:
            return "Top";
        case Region::Bottom:
            return "Bottom";
    }
    return "Unknown";
}

std::string_view to_string(Direction d)
{
    switch (d)
    {
        case Direction::Left:
            return "Left";
        case Direction::Right:
            return "Right";
        case Direction::Up:
            return "Up";
        case Direction::Down:
            return "Down";
    }
    return "Unknown";
}

std::string_view to_string(SessionPhase p)
{
    switch (p)
    {
        case SessionPhase::Idle:
            return "Idle";
        case SessionPhase::Dragging:
            return "Dragging";
        case SessionPhase::Locked:
            return "Locked";
        case SessionPhase::CommittingForward:
            return "CommittingForward";
        case SessionPhase::CommittingBack:
            return "CommittingBack";
        case SessionPhase::PeripheralActive:
            return "PeripheralActive";
        case SessionPhase::Returning:
            return "Returning";
    }
    return "Unknown";
}

std::string_view to_string(HapticIntensity h)
{
    switch (h)
    {
        case HapticIntensity::Soft:
            return "soft";
        case HapticIntensity::Medium:
            return "medium";
        case HapticIntensity::Heavy:
            return "heavy";
    }
    return "unknown";
}

std::string_view to_string(ReturnTrigger t)
{
    switch (t)
    {
        case ReturnTrigger::Button:
            return "button";
        case ReturnTrigger::Programmatic:
            return "programmatic";
        case ReturnTrigger::PlatformBack:
            return "platform_back";
    }
    return "unknown";
}

std::optional<HapticIntensity> haptic_from_string(std::string_view name)
{
    if (name == "soft")
        return HapticIntensity::Soft;
    if (name == "medium")
        return HapticIntensity::Medium;
    if (name == "heavy")
        return HapticIntensity::Heavy;
    return std::nullopt;
}

}   // namespace fivenav
