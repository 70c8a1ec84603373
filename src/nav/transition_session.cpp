#include "transition_session.hpp"

#include <algorithm>
#include <cmath>
#include <fivenav/logger.hpp>

#include "return_button.hpp"

namespace fivenav
{

namespace
{

// Marks the session as inside an observer callback for its lifetime.
class DispatchScope
{
   public:
    explicit DispatchScope(bool& flag) : flag_(flag), prev_(flag) { flag_ = true; }
    ~DispatchScope() { flag_ = prev_; }

    DispatchScope(const DispatchScope&)            = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

   private:
    bool& flag_;
    bool  prev_;
};

}   // anonymous namespace

TransitionSession::TransitionSession(const NavigatorConfig& config) : config_(config)
{
    present_[region_index(Region::Center)] = true;
    classifier_.set_zone(config_.detection);
    classifier_.set_present(present_);
}

TransitionSession::~TransitionSession() = default;

// ─── Setup ───────────────────────────────────────────────────────────────────

bool TransitionSession::set_config(const NavigatorConfig& config)
{
    if (phase_ != SessionPhase::Idle || pointer_target_ != PointerTarget::None)
    {
        FIVENAV_LOG_DEBUG("session", "set_config ignored while {}", to_string(phase_));
        return false;
    }
    config_ = config;
    classifier_.set_zone(config_.detection);
    return true;
}

void TransitionSession::set_viewport(Size2 viewport)
{
    viewport_ = viewport;
    classifier_.set_viewport(viewport);
    if (swipe_back_)
        swipe_back_->set_viewport(viewport);
}

void TransitionSession::set_region_present(Region region, bool present)
{
    if (region == Region::Center)
        return;
    present_[region_index(region)] = present;
    classifier_.set_present(present_);
}

void TransitionSession::add_observer(NavigatorObserver* observer)
{
    if (!observer)
        return;
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void TransitionSession::remove_observer(NavigatorObserver* observer)
{
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

bool TransitionSession::reject_if_dispatching(const char* call) const
{
    if (!dispatching_)
        return false;
    FIVENAV_LOG_DEBUG("session", "{} dropped: called from an observer callback", call);
    return true;
}

// ─── Pointer input ───────────────────────────────────────────────────────────

bool TransitionSession::pointer_down(Vec2 pos)
{
    if (reject_if_dispatching("pointer_down"))
        return false;
    if (pointer_target_ != PointerTarget::None || button_pressed_)
        return false;

    switch (phase_)
    {
        case SessionPhase::Idle:
        {
            if (viewport_.empty() || !viewport_.contains(pos))
                return false;

            if (can_swipe_)
            {
                bool allowed = false;
                try
                {
                    allowed = can_swipe_();
                }
                catch (const std::exception& e)
                {
                    FIVENAV_LOG_WARN("session", "can_swipe_from_center threw: {}", e.what());
                }
                if (!allowed)
                {
                    FIVENAV_LOG_DEBUG("session", "Drag rejected by can_swipe_from_center");
                    return false;
                }
            }

            phase_                  = SessionPhase::Dragging;
            pointer_target_         = PointerTarget::CenterDrag;
            last_pointer_           = pos;
            progress_               = 0.0f;
            signed_progress_        = 0.0f;
            haptic_armed_           = true;
            cancelled_from_preview_ = false;
            classifier_.begin(pos);
            return true;
        }

        case SessionPhase::PeripheralActive:
        {
            if (config_.return_button.visible)
            {
                auto layout = return_button::layout_for(active_, viewport_, config_.return_button);
                button_pressed_ = layout && return_button::hit_test(*layout, pos)
                                  && !swipe_back_in_flight();
            }
            if (swipe_back_ && swipe_back_->pointer_down(pos))
                pointer_target_ = PointerTarget::SwipeBack;
            last_pointer_ = pos;
            return button_pressed_ || pointer_target_ == PointerTarget::SwipeBack;
        }

        default:
            FIVENAV_LOG_DEBUG("session", "pointer_down ignored while {}", to_string(phase_));
            return false;
    }
}

void TransitionSession::pointer_move(Vec2 pos)
{
    Vec2 delta    = pos - last_pointer_;
    last_pointer_ = pos;

    if (button_pressed_)
    {
        auto layout = return_button::layout_for(active_, viewport_, config_.return_button);
        if (!layout || !return_button::hit_test(*layout, pos))
            button_pressed_ = false;
    }

    if (pointer_target_ == PointerTarget::SwipeBack && swipe_back_)
    {
        swipe_back_->pointer_move(pos);
        return;
    }

    if (pointer_target_ != PointerTarget::CenterDrag)
        return;
    if (phase_ != SessionPhase::Dragging && phase_ != SessionPhase::Locked)
        return;

    auto step = classifier_.feed(delta);
    if (step.just_locked)
    {
        phase_            = SessionPhase::Locked;
        direction_        = step.direction;
        reveal_direction_ = step.direction;
        target_           = revealed_region(*step.direction);
    }
    if (step.direction)
        apply_axis_delta(step.axis_delta);
}

void TransitionSession::apply_axis_delta(float axis_delta)
{
    if (!direction_)
        return;

    const Direction d      = *direction_;
    const float     extent = axis_of(d) == Axis::Horizontal ? viewport_.width : viewport_.height;
    if (extent <= 0.0f)
        return;

    signed_progress_ += axis_delta / extent;
    if (direction_sign(d) < 0.0f)
        signed_progress_ = std::clamp(signed_progress_, -1.0f, 0.0f);
    else
        signed_progress_ = std::clamp(signed_progress_, 0.0f, 1.0f);
    progress_ = std::fabs(signed_progress_);

    if (progress_ >= config_.commit_threshold)
    {
        if (haptic_armed_)
        {
            haptic_armed_ = false;
            emit_haptic();
        }
    }
    else
    {
        haptic_armed_ = true;
    }
}

void TransitionSession::pointer_up(Vec2 pos)
{
    if (pos != last_pointer_)
        pointer_move(pos);

    const bool tap  = button_pressed_;
    button_pressed_ = false;

    switch (pointer_target_)
    {
        case PointerTarget::CenterDrag:
            pointer_target_ = PointerTarget::None;
            release_center_drag(false);
            break;
        case PointerTarget::SwipeBack:
            pointer_target_ = PointerTarget::None;
            if (!swipe_back_)
                break;
            if (tap)
                swipe_back_->abort();
            else
                swipe_back_->pointer_up(now_);
            break;
        case PointerTarget::None:
            break;
    }

    if (tap && phase_ == SessionPhase::PeripheralActive)
    {
        emit_haptic();
        request_return(ReturnTrigger::Button);
    }
}

void TransitionSession::pointer_cancel()
{
    button_pressed_ = false;
    switch (pointer_target_)
    {
        case PointerTarget::CenterDrag:
            pointer_target_ = PointerTarget::None;
            release_center_drag(true);
            break;
        case PointerTarget::SwipeBack:
            pointer_target_ = PointerTarget::None;
            if (swipe_back_)
                swipe_back_->pointer_cancel(now_);
            break;
        case PointerTarget::None:
            break;
    }
}

void TransitionSession::release_center_drag(bool cancelled)
{
    if (phase_ == SessionPhase::Dragging)
    {
        FIVENAV_LOG_DEBUG("session", "Released before a direction locked");
        complete_back();
        return;
    }
    if (phase_ != SessionPhase::Locked)
        return;

    const bool present = region_present(target_);
    if (!cancelled && present && progress_ >= config_.commit_threshold)
    {
        FIVENAV_LOG_DEBUG("session", "Committing to {} from {}", to_string(target_), progress_);
        start_animation(SessionPhase::CommittingForward, 1.0f, config_.transition_duration);
    }
    else
    {
        if (!present)
            FIVENAV_LOG_DEBUG("session", "Target {} has no content, cancelling", to_string(target_));
        cancelled_from_preview_ = config_.preview.enabled;
        start_animation(SessionPhase::CommittingBack, 0.0f, config_.transition_duration);
    }
    classifier_.reset();
}

// ─── Programmatic / external triggers ────────────────────────────────────────

bool TransitionSession::begin_programmatic(Direction d)
{
    if (reject_if_dispatching("navigate"))
        return false;
    if (phase_ != SessionPhase::Idle)
    {
        FIVENAV_LOG_DEBUG("session", "navigate({}) ignored while {}", to_string(d), to_string(phase_));
        return false;
    }

    Region target = revealed_region(d);
    if (!region_present(target))
    {
        FIVENAV_LOG_DEBUG("session", "navigate({}) ignored: {} has no content", to_string(d), to_string(target));
        return false;
    }

    direction_              = d;
    reveal_direction_       = d;
    target_                 = target;
    progress_               = 0.0f;
    signed_progress_        = 0.0f;
    cancelled_from_preview_ = false;
    start_animation(SessionPhase::CommittingForward, 1.0f, config_.transition_duration);
    return true;
}

bool TransitionSession::request_return(ReturnTrigger trigger)
{
    if (reject_if_dispatching("return_to_center"))
        return false;
    if (phase_ != SessionPhase::PeripheralActive)
    {
        FIVENAV_LOG_DEBUG("session", "Return ({}) ignored while {}", to_string(trigger), to_string(phase_));
        return false;
    }
    if (swipe_back_in_flight())
    {
        FIVENAV_LOG_DEBUG("session", "Return ({}) suppressed: swipe-back in flight", to_string(trigger));
        return false;
    }

    FIVENAV_LOG_INFO("session", "Returning from {} ({})", to_string(active_), to_string(trigger));

    swipe_back_.reset();
    pointer_target_ = PointerTarget::None;
    button_pressed_ = false;

    target_    = Region::Center;
    direction_ = reveal_direction_ ? std::optional<Direction>(opposite(*reveal_direction_))
                                   : std::optional<Direction>(opposite(*direction_for_region(active_)));
    progress_  = 1.0f;
    start_animation(SessionPhase::Returning, 0.0f, config_.return_duration);
    emit_page_changed(Region::Center);
    return true;
}

bool TransitionSession::handle_back_signal()
{
    if (reject_if_dispatching("handle_back_signal"))
        return false;

    switch (phase_)
    {
        case SessionPhase::PeripheralActive:
            if (swipe_back_in_flight())
            {
                FIVENAV_LOG_DEBUG("session", "Back signal consumed by in-flight swipe-back");
                return true;
            }
            request_return(ReturnTrigger::PlatformBack);
            return true;
        case SessionPhase::CommittingForward:
        case SessionPhase::Returning:
            FIVENAV_LOG_DEBUG("session", "Back signal consumed while {}", to_string(phase_));
            return true;
        default:
            return false;
    }
}

// ─── Animation ───────────────────────────────────────────────────────────────

void TransitionSession::start_animation(SessionPhase phase, float target, float duration)
{
    phase_        = phase;
    haptic_armed_ = true;
    if (progress_ == target)
    {
        settle_animation(target);
        return;
    }
    // The host may not have ticked for a while, so the clock starts on the
    // next update().
    anim_.emplace(progress_, target, now_, duration, config_.easing());
    anim_pending_ = true;
}

void TransitionSession::update(double now)
{
    now_ = now;
    if (!entrance_started_)
    {
        entrance_started_ = true;
        entrance_start_   = now;
    }

    if (anim_ && is_busy())
    {
        if (anim_pending_)
        {
            anim_->set_start_time(now);
            anim_pending_ = false;
        }

        float value = progress_;
        try
        {
            value = anim_->value_at(now);
        }
        catch (const std::exception& e)
        {
            recover_from_animation_failure(e.what());
            return;
        }

        progress_ = value;
        if (phase_ != SessionPhase::Returning && reveal_direction_)
            signed_progress_ = value * direction_sign(*reveal_direction_);

        if (anim_->finished_at(now))
            settle_animation(anim_->to());
    }

    if (phase_ == SessionPhase::PeripheralActive && swipe_back_)
    {
        if (swipe_back_->update(now) == PeripheralSwipeBackSession::Outcome::Committed)
            complete_swipe_back();
    }
}

void TransitionSession::settle_animation(float final_value)
{
    anim_.reset();
    anim_pending_ = false;
    switch (phase_)
    {
        case SessionPhase::CommittingForward:
        case SessionPhase::CommittingBack:
            if (final_value >= 1.0f && region_present(target_))
                complete_forward();
            else
                complete_back();
            break;

        case SessionPhase::Returning:
            if (final_value <= 0.0f)
            {
                complete_return();
            }
            else
            {
                // Snapped back onto the peripheral.
                phase_     = SessionPhase::PeripheralActive;
                progress_  = 1.0f;
                target_    = active_;
                direction_ = reveal_direction_;
                make_swipe_back();
                emit_page_changed(active_);
            }
            break;

        default:
            break;
    }
}

void TransitionSession::recover_from_animation_failure(const char* what)
{
    // A cancelled drag never opens its target.
    const float snapped =
        phase_ != SessionPhase::CommittingBack && progress_ >= 0.5f ? 1.0f : 0.0f;
    FIVENAV_LOG_WARN("session",
                     "Animation failed while {} ({}), settling at {}",
                     to_string(phase_),
                     what,
                     snapped);
    progress_ = snapped;
    settle_animation(snapped);
}

// ─── Completion points ───────────────────────────────────────────────────────

void TransitionSession::complete_forward()
{
    active_                 = target_;
    phase_                  = SessionPhase::PeripheralActive;
    progress_               = 1.0f;
    signed_progress_        = reveal_direction_ ? direction_sign(*reveal_direction_) : 1.0f;
    direction_              = reveal_direction_;
    cancelled_from_preview_ = false;
    clear_gesture();
    make_swipe_back();

    FIVENAV_LOG_INFO("session", "Opened {}", to_string(active_));
    emit_page_changed(active_);
    emit_region_opened(active_);
}

void TransitionSession::complete_back()
{
    phase_                  = SessionPhase::Idle;
    progress_               = 0.0f;
    signed_progress_        = 0.0f;
    target_                 = Region::Center;
    cancelled_from_preview_ = false;
    direction_.reset();
    reveal_direction_.reset();
    clear_gesture();
}

void TransitionSession::complete_return()
{
    phase_           = SessionPhase::Idle;
    progress_        = 0.0f;
    signed_progress_ = 0.0f;
    active_          = Region::Center;
    target_          = Region::Center;
    direction_.reset();
    reveal_direction_.reset();
    swipe_back_.reset();

    FIVENAV_LOG_INFO("session", "Back on center");
    emit_returned_to_center();
}

void TransitionSession::complete_swipe_back()
{
    const Region from = active_;
    swipe_back_.reset();
    pointer_target_ = PointerTarget::None;
    button_pressed_ = false;

    phase_           = SessionPhase::Idle;
    progress_        = 0.0f;
    signed_progress_ = 0.0f;
    active_          = Region::Center;
    target_          = Region::Center;
    direction_.reset();
    reveal_direction_.reset();

    FIVENAV_LOG_INFO("session", "Swiped back from {}", to_string(from));
    emit_page_changed(Region::Center);
    emit_returned_to_center();
}

void TransitionSession::make_swipe_back()
{
    swipe_back_.reset();
    if (!config_.swipe_back.enabled_for(active_))
        return;

    swipe_back_ = std::make_unique<PeripheralSwipeBackSession>(active_,
                                                                config_.swipe_back.edge_fraction,
                                                                viewport_,
                                                                config_.transition_duration,
                                                                config_.easing());
    swipe_back_->set_haptic_callback([this]() { emit_haptic(); });
}

void TransitionSession::clear_gesture()
{
    classifier_.reset();
    if (pointer_target_ == PointerTarget::CenterDrag)
        pointer_target_ = PointerTarget::None;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool TransitionSession::is_busy() const
{
    return phase_ == SessionPhase::CommittingForward || phase_ == SessionPhase::CommittingBack
           || phase_ == SessionPhase::Returning;
}

bool TransitionSession::is_transitioning() const
{
    if (phase_ != SessionPhase::Idle && phase_ != SessionPhase::PeripheralActive)
        return true;
    return swipe_back_in_flight();
}

bool TransitionSession::preview_active() const
{
    if (!config_.preview.enabled)
        return false;
    return phase_ == SessionPhase::Locked
           || (phase_ == SessionPhase::CommittingBack && cancelled_from_preview_);
}

bool TransitionSession::swipe_back_in_flight() const
{
    return swipe_back_ && swipe_back_->in_flight();
}

std::optional<ReturnButtonLayout> TransitionSession::return_button_layout() const
{
    if (!config_.return_button.visible || phase_ != SessionPhase::PeripheralActive)
        return std::nullopt;
    if (swipe_back_in_flight())
        return std::nullopt;
    return return_button::layout_for(active_, viewport_, config_.return_button);
}

float TransitionSession::center_entrance_opacity() const
{
    if (!config_.animate_center_entrance)
        return 1.0f;
    if (!entrance_started_)
        return 0.0f;
    if (config_.center_entrance_duration <= 0.0f)
        return 1.0f;

    double t = (now_ - entrance_start_) / static_cast<double>(config_.center_entrance_duration);
    return ease::ease_in(static_cast<float>(std::clamp(t, 0.0, 1.0)));
}

// ─── Notifications ───────────────────────────────────────────────────────────

void TransitionSession::dispatch(const char* what, const std::function<void(NavigatorObserver&)>& fn)
{
    if (observers_.empty())
        return;

    DispatchScope scope(dispatching_);
    auto          snapshot = observers_;
    for (auto* observer : snapshot)
    {
        // Skip observers removed by an earlier callback in this round.
        if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
            continue;
        try
        {
            fn(*observer);
        }
        catch (const std::exception& e)
        {
            FIVENAV_LOG_ERROR("session", "Observer threw from {}: {}", what, e.what());
        }
    }
}

void TransitionSession::emit_page_changed(Region r)
{
    FIVENAV_LOG_DEBUG("session", "page_changed({})", to_string(r));
    dispatch("on_page_changed", [r](NavigatorObserver& o) { o.on_page_changed(r); });
}

void TransitionSession::emit_region_opened(Region r)
{
    FIVENAV_LOG_DEBUG("session", "region_opened({})", to_string(r));
    dispatch("on_region_opened", [r](NavigatorObserver& o) { o.on_region_opened(r); });
}

void TransitionSession::emit_returned_to_center()
{
    FIVENAV_LOG_DEBUG("session", "returned_to_center");
    dispatch("on_returned_to_center", [](NavigatorObserver& o) { o.on_returned_to_center(); });
}

void TransitionSession::emit_haptic()
{
    const HapticIntensity intensity = config_.haptic;
    FIVENAV_LOG_TRACE("session", "haptic({})", to_string(intensity));
    dispatch("on_haptic", [intensity](NavigatorObserver& o) { o.on_haptic(intensity); });
}

}   // namespace fivenav
