#pragma once

#include <array>
#include <fivenav/config.hpp>
#include <fivenav/frame.hpp>
#include <fivenav/fwd.hpp>
#include <fivenav/observer.hpp>
#include <fivenav/types.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace fivenav
{

// Five-region navigator. Center is always present; peripherals are optional
// and only reachable when the host supplied content for them.
//
// Single-threaded. Feed pointer events as they arrive, call update() once
// per frame with a monotonic clock in seconds, then draw frame().
//
//   fivenav::Navigator nav;
//   nav.set_viewport({400, 800});
//   nav.set_region(fivenav::Region::Center, {"home"});
//   nav.set_region(fivenav::Region::Left, {"settings"});
//   nav.navigate(fivenav::Direction::Right);   // reveals Left
//   nav.update(t);
class Navigator
{
   public:
    explicit Navigator(const NavigatorConfig& config = {});
    ~Navigator();

    Navigator(const Navigator&)            = delete;
    Navigator& operator=(const Navigator&) = delete;

    // ─── Regions ─────────────────────────────────────────────────────────
    void set_region(Region region, RegionContent content);

    // Refused for Center and for a region that is active or being
    // transitioned to.
    bool clear_region(Region region);

    bool                 has_region(Region region) const;
    const RegionContent* region_content(Region region) const;

    // ─── Setup ───────────────────────────────────────────────────────────
    void  set_viewport(Size2 viewport);
    Size2 viewport() const;

    const NavigatorConfig& config() const;

    // Sanitizes and applies the config. Only accepted while Idle.
    bool set_config(NavigatorConfig config);

    // Consulted on every pointer-down at Center; false blocks the drag.
    void set_can_swipe_from_center(std::function<bool()> predicate);

    // Observers are not owned and must outlive their registration.
    void add_observer(NavigatorObserver* observer);
    void remove_observer(NavigatorObserver* observer);

    // ─── Input and frames ────────────────────────────────────────────────
    bool pointer_down(Vec2 pos);
    void pointer_move(Vec2 pos);
    void pointer_up(Vec2 pos);
    void pointer_cancel();

    void update(double now_seconds);

    RenderFrame frame() const;

    // ─── Navigation ──────────────────────────────────────────────────────
    // Effective only from Idle with the revealed region present.
    bool navigate(Direction d);
    bool navigate_to(Region region);

    // Effective only while a peripheral is settled.
    bool return_to_center();

    // Platform back. Returns true when consumed; false at Center so the
    // host can fall back to its own handling.
    bool handle_back_signal();

    // ─── Queries ─────────────────────────────────────────────────────────
    Region       current_region() const;
    SessionPhase phase() const;
    float        progress() const;
    bool         is_transitioning() const;

    // Exposed for tests and tooling.
    const TransitionSession& session() const { return *session_; }

   private:
    std::unique_ptr<TransitionSession>                       session_;
    std::unique_ptr<FrameComposer>                           composer_;
    std::array<std::optional<RegionContent>, REGION_COUNT> contents_;
};

}   // namespace fivenav
