#pragma once

#include <fivenav/config.hpp>
#include <fivenav/types.hpp>
#include <optional>

namespace fivenav
{

// Turns a drag that starts on Center into a locked Direction, or decides the
// drag can never lock. The lock decision looks at the cumulative displacement
// and the origin's membership in the edge bands; once made it never changes.
class GestureClassifier
{
   public:
    static constexpr float LOCK_THRESHOLD_PX = 5.0f;

    enum class State
    {
        Idle,       // no gesture
        Unlocked,   // below lock threshold
        Locked,
        Inert,      // dominant axis/band combination invalid
    };

    struct Step
    {
        std::optional<Direction> direction;
        // Displacement along the locked axis to apply this step. On the
        // locking step this is the whole cumulative displacement.
        float axis_delta  = 0.0f;
        bool  just_locked = false;
    };

    GestureClassifier() = default;
    GestureClassifier(const DetectionZone& zone, Size2 viewport, const RegionMask& present);

    void set_zone(const DetectionZone& zone) { zone_ = zone; }
    void set_viewport(Size2 viewport) { viewport_ = viewport; }
    void set_present(const RegionMask& present) { present_ = present; }

    void begin(Vec2 origin);
    Step feed(Vec2 delta);
    void reset();

    State                    state() const { return state_; }
    std::optional<Direction> direction() const { return direction_; }
    Vec2                     origin() const { return origin_; }
    Vec2                     cumulative() const { return cumulative_; }
    bool                     is_active() const { return state_ != State::Idle; }

   private:
    std::optional<Direction> classify() const;
    bool                     present(Region r) const { return present_[region_index(r)]; }

    DetectionZone zone_;
    Size2         viewport_;
    RegionMask    present_{};

    State                    state_ = State::Idle;
    Vec2                     origin_;
    Vec2                     cumulative_;
    std::optional<Direction> direction_;
};

}   // namespace fivenav
