#pragma once

#include <fivenav/config.hpp>
#include <fivenav/observer.hpp>
#include <fivenav/types.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "anim/progress_animation.hpp"
#include "gesture_classifier.hpp"
#include "swipe_back_session.hpp"

namespace fivenav
{

// Primary navigation state machine. Owns the transition progress, the phase,
// the active region and the per-peripheral swipe-back session.
//
// Time is pulled: the host calls update(now) once per frame and every
// animation started by an input event is anchored at the last update time.
//
// Phase flow:
//   Idle → Dragging → Locked → CommittingForward → PeripheralActive
//                           ↘ CommittingBack → Idle
//   PeripheralActive → Returning → Idle         (button / programmatic / back)
//   PeripheralActive → Idle                     (swipe-back commit)
class TransitionSession
{
   public:
    using CanSwipePredicate = std::function<bool()>;

    explicit TransitionSession(const NavigatorConfig& config = {});
    ~TransitionSession();

    TransitionSession(const TransitionSession&)            = delete;
    TransitionSession& operator=(const TransitionSession&) = delete;

    // ─── Setup ──────────────────────────────────────────────────────────
    // Only accepted while Idle. The config is taken as given; callers
    // sanitize beforehand.
    bool                   set_config(const NavigatorConfig& config);
    const NavigatorConfig& config() const { return config_; }

    void  set_viewport(Size2 viewport);
    Size2 viewport() const { return viewport_; }

    void              set_region_present(Region region, bool present);
    bool              region_present(Region region) const { return present_[region_index(region)]; }
    const RegionMask& regions() const { return present_; }

    void set_can_swipe_from_center(CanSwipePredicate pred) { can_swipe_ = std::move(pred); }

    void add_observer(NavigatorObserver* observer);
    void remove_observer(NavigatorObserver* observer);

    // ─── Input ──────────────────────────────────────────────────────────
    // Single pointer. Returns true when the press was taken by the session
    // (center drag, swipe-back drag or return button).
    bool pointer_down(Vec2 pos);
    void pointer_move(Vec2 pos);
    void pointer_up(Vec2 pos);
    void pointer_cancel();

    // Idle only, target present. Animates straight to the peripheral.
    bool begin_programmatic(Direction d);

    // PeripheralActive only. Starts the Returning animation.
    bool request_return(ReturnTrigger trigger);

    // Returns true when the signal was consumed by the navigator (any state
    // off Center), false when the host should apply its own back handling.
    bool handle_back_signal();

    void update(double now);

    // ─── Queries ────────────────────────────────────────────────────────
    SessionPhase phase() const { return phase_; }
    float        progress() const { return progress_; }
    float        signed_progress() const { return signed_progress_; }
    Region       active_region() const { return active_; }
    Region       target_region() const { return target_; }
    double       now() const { return now_; }

    // Direction the visuals currently move in: the locked/programmatic
    // direction while going out, the reverse of it while Returning.
    std::optional<Direction> direction() const { return direction_; }

    // Direction that revealed the current (or pending) peripheral.
    std::optional<Direction> reveal_direction() const { return reveal_direction_; }

    bool is_busy() const;
    bool is_transitioning() const;
    bool is_dispatching() const { return dispatching_; }

    // True while the preview card replaces moving content.
    bool preview_active() const;

    const PeripheralSwipeBackSession* swipe_back() const { return swipe_back_.get(); }
    bool                              swipe_back_in_flight() const;

    // Layout of the return button when it should be shown this frame.
    std::optional<ReturnButtonLayout> return_button_layout() const;

    // Multiplier for the Center layer's opacity (entrance fade).
    float center_entrance_opacity() const;

    const GestureClassifier& classifier() const { return classifier_; }

   private:
    enum class PointerTarget
    {
        None,
        CenterDrag,
        SwipeBack,
    };

    void apply_axis_delta(float axis_delta);
    void release_center_drag(bool cancelled);

    void start_animation(SessionPhase phase, float target, float duration);
    void settle_animation(float final_value);
    void recover_from_animation_failure(const char* what);

    void complete_forward();
    void complete_back();
    void complete_return();
    void complete_swipe_back();

    void make_swipe_back();
    void clear_gesture();

    void emit_page_changed(Region r);
    void emit_region_opened(Region r);
    void emit_returned_to_center();
    void emit_haptic();
    void dispatch(const char* what, const std::function<void(NavigatorObserver&)>& fn);

    bool reject_if_dispatching(const char* call) const;

    NavigatorConfig   config_;
    Size2             viewport_;
    RegionMask        present_{};
    CanSwipePredicate can_swipe_;

    std::vector<NavigatorObserver*> observers_;

    GestureClassifier classifier_;

    SessionPhase             phase_           = SessionPhase::Idle;
    float                    progress_        = 0.0f;
    float                    signed_progress_ = 0.0f;
    Region                   active_          = Region::Center;
    Region                   target_          = Region::Center;
    std::optional<Direction> direction_;
    std::optional<Direction> reveal_direction_;

    std::optional<ProgressAnimation> anim_;
    bool                             anim_pending_ = false;
    double                           now_          = 0.0;
    bool                             haptic_armed_ = true;
    bool                             dispatching_  = false;

    PointerTarget pointer_target_         = PointerTarget::None;
    Vec2          last_pointer_           = {};
    bool          button_pressed_         = false;
    bool          cancelled_from_preview_ = false;

    std::unique_ptr<PeripheralSwipeBackSession> swipe_back_;

    bool   entrance_started_ = false;
    double entrance_start_   = 0.0;
};

}   // namespace fivenav
