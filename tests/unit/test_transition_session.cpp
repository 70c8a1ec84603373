#include <gtest/gtest.h>
#include <stdexcept>

#include "nav/transition_session.hpp"
#include "util/navigator_fixture.hpp"

using namespace fivenav;
using fivenav::test::RecordingObserver;

namespace
{

constexpr Size2 VP{400.0f, 800.0f};

class TransitionSessionTest : public ::testing::Test
{
   protected:
    void SetUp() override { build({}); }

    void build(const NavigatorConfig& config)
    {
        session_ = std::make_unique<TransitionSession>(config);
        session_->set_viewport(VP);
        for (auto r : PERIPHERAL_REGIONS)
            session_->set_region_present(r, true);
        session_->add_observer(&observer_);
        session_->update(0.0);
    }

    // Press in the left band and drag right by dx pixels, in 1 px steps for
    // the first few so the lock happens on a known step.
    void drag_right(float dx)
    {
        ASSERT_TRUE(session_->pointer_down({50.0f, 400.0f}));
        session_->pointer_move({53.0f, 400.0f});
        session_->pointer_move({50.0f + dx, 400.0f});
    }

    void open_left()
    {
        ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
        session_->update(0.0);
        session_->update(0.5);
        ASSERT_EQ(session_->phase(), SessionPhase::PeripheralActive);
        observer_.events.clear();
    }

    std::unique_ptr<TransitionSession> session_;
    RecordingObserver                  observer_;
};

}   // anonymous namespace

// ─── Drag, lock and commit ──────────────────────────────────────────────────

TEST_F(TransitionSessionTest, PressAtCenterStartsDragging)
{
    EXPECT_TRUE(session_->pointer_down({50.0f, 400.0f}));
    EXPECT_EQ(session_->phase(), SessionPhase::Dragging);
    session_->pointer_move({53.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::Dragging);
    EXPECT_FLOAT_EQ(session_->progress(), 0.0f);
}

TEST_F(TransitionSessionTest, LockSetsTargetAndProgress)
{
    drag_right(120.0f);
    EXPECT_EQ(session_->phase(), SessionPhase::Locked);
    EXPECT_EQ(session_->direction(), Direction::Right);
    EXPECT_EQ(session_->target_region(), Region::Left);
    EXPECT_FLOAT_EQ(session_->progress(), 0.3f);
    EXPECT_FLOAT_EQ(session_->signed_progress(), 0.3f);
}

TEST_F(TransitionSessionTest, LockedDirectionIgnoresOtherAxis)
{
    drag_right(80.0f);
    session_->pointer_move({130.0f, 100.0f});
    EXPECT_EQ(session_->direction(), Direction::Right);
    EXPECT_FLOAT_EQ(session_->progress(), 0.2f);
}

TEST_F(TransitionSessionTest, ProgressStaysInUnitRange)
{
    drag_right(20.0f);
    session_->pointer_move({-300.0f, 400.0f});
    EXPECT_FLOAT_EQ(session_->progress(), 0.0f);
    session_->pointer_move({900.0f, 400.0f});
    EXPECT_FLOAT_EQ(session_->progress(), 1.0f);
}

TEST_F(TransitionSessionTest, ReleaseAboveThresholdCommits)
{
    drag_right(120.0f);
    session_->pointer_up({170.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingForward);

    session_->update(0.0);
    EXPECT_FLOAT_EQ(session_->progress(), 0.3f);
    session_->update(0.1);
    EXPECT_GT(session_->progress(), 0.3f);
    EXPECT_LT(session_->progress(), 1.0f);

    session_->update(0.5);
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    EXPECT_EQ(session_->active_region(), Region::Left);
    EXPECT_FLOAT_EQ(session_->progress(), 1.0f);
    EXPECT_EQ(observer_.events,
              (std::vector<std::string>{"page_changed:Left", "region_opened:Left"}));
}

TEST_F(TransitionSessionTest, ReleaseBelowThresholdCancels)
{
    drag_right(70.0f);
    session_->pointer_up({120.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingBack);

    session_->update(0.0);
    session_->update(0.5);
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
    EXPECT_EQ(session_->active_region(), Region::Center);
    EXPECT_FLOAT_EQ(session_->progress(), 0.0f);
    EXPECT_TRUE(observer_.events.empty());
}

TEST_F(TransitionSessionTest, CancelNeverCommits)
{
    drag_right(200.0f);
    session_->pointer_cancel();
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingBack);
    session_->update(0.0);
    session_->update(0.5);
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
}

TEST_F(TransitionSessionTest, ReleaseBeforeLockReturnsToIdle)
{
    ASSERT_TRUE(session_->pointer_down({50.0f, 400.0f}));
    session_->pointer_move({52.0f, 400.0f});
    session_->pointer_up({52.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
}

TEST_F(TransitionSessionTest, HapticRearmsWhenDroppingBelowThreshold)
{
    drag_right(120.0f);   // 0.3
    EXPECT_EQ(observer_.haptics, 1);
    session_->pointer_move({130.0f, 400.0f});   // 0.2
    EXPECT_EQ(observer_.haptics, 1);
    session_->pointer_move({170.0f, 400.0f});   // 0.3
    EXPECT_EQ(observer_.haptics, 2);
}

// ─── Programmatic navigation ────────────────────────────────────────────────

TEST_F(TransitionSessionTest, ProgrammaticRequiresIdleAndContent)
{
    session_->set_region_present(Region::Left, false);
    EXPECT_FALSE(session_->begin_programmatic(Direction::Right));

    EXPECT_TRUE(session_->begin_programmatic(Direction::Up));
    EXPECT_EQ(session_->target_region(), Region::Bottom);
    EXPECT_FALSE(session_->begin_programmatic(Direction::Down));
}

TEST_F(TransitionSessionTest, CenterCannotBeMarkedAbsent)
{
    session_->set_region_present(Region::Center, false);
    EXPECT_TRUE(session_->region_present(Region::Center));
}

// ─── Returning ──────────────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, ReturnAnimatesBackToCenter)
{
    open_left();
    ASSERT_TRUE(session_->request_return(ReturnTrigger::Programmatic));
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
    EXPECT_EQ(session_->direction(), Direction::Left);
    EXPECT_EQ(observer_.events, (std::vector<std::string>{"page_changed:Center"}));

    session_->update(0.5);
    session_->update(0.6);
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
    EXPECT_LT(session_->progress(), 1.0f);

    session_->update(1.0);
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
    EXPECT_EQ(session_->active_region(), Region::Center);
    EXPECT_EQ(observer_.count("returned_to_center"), 1);
}

TEST_F(TransitionSessionTest, AnimationClockStartsAtNextUpdate)
{
    // Nothing ticks while idle; the first frame after the request is late.
    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    session_->update(10.0);
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingForward);
    EXPECT_FLOAT_EQ(session_->progress(), 0.0f);

    session_->update(10.1);
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingForward);
    EXPECT_GT(session_->progress(), 0.0f);
    EXPECT_LT(session_->progress(), 1.0f);

    session_->update(10.5);
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);

    ASSERT_TRUE(session_->request_return(ReturnTrigger::Programmatic));
    session_->update(60.0);
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
    EXPECT_FLOAT_EQ(session_->progress(), 1.0f);
    session_->update(60.5);
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
}

TEST_F(TransitionSessionTest, ReturnRunsOppositeToReveal)
{
    for (auto d : {Direction::Left, Direction::Right, Direction::Up, Direction::Down})
    {
        build({});
        ASSERT_TRUE(session_->begin_programmatic(d));
        session_->update(0.0);
        session_->update(0.5);
        ASSERT_EQ(session_->phase(), SessionPhase::PeripheralActive);

        ASSERT_TRUE(session_->request_return(ReturnTrigger::Programmatic));
        EXPECT_EQ(session_->direction(), opposite(d));
    }
}

TEST_F(TransitionSessionTest, ReturnOnlyFromPeripheral)
{
    EXPECT_FALSE(session_->request_return(ReturnTrigger::Programmatic));
    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    EXPECT_FALSE(session_->request_return(ReturnTrigger::Programmatic));
}

TEST_F(TransitionSessionTest, BackSignal)
{
    EXPECT_FALSE(session_->handle_back_signal());

    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    EXPECT_TRUE(session_->handle_back_signal());
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingForward);

    session_->update(0.0);
    session_->update(0.5);
    EXPECT_TRUE(session_->handle_back_signal());
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
    EXPECT_TRUE(session_->handle_back_signal());
}

// ─── Swipe-back ─────────────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, SwipeBackSessionOnlyForEnabledRegions)
{
    NavigatorConfig cfg;
    cfg.swipe_back.left = true;
    build(cfg);

    open_left();
    EXPECT_NE(session_->swipe_back(), nullptr);
    session_->request_return(ReturnTrigger::Programmatic);
    session_->update(0.5);
    session_->update(1.0);
    EXPECT_EQ(session_->swipe_back(), nullptr);

    ASSERT_TRUE(session_->begin_programmatic(Direction::Left));
    session_->update(1.0);
    session_->update(1.5);
    EXPECT_EQ(session_->active_region(), Region::Right);
    EXPECT_EQ(session_->swipe_back(), nullptr);
}

TEST_F(TransitionSessionTest, SwipeBackCommitGoesStraightToIdle)
{
    NavigatorConfig cfg;
    cfg.swipe_back.left = true;
    build(cfg);
    open_left();

    // Left region: swipe-back starts in the right edge band and moves left.
    ASSERT_TRUE(session_->pointer_down({390.0f, 400.0f}));
    session_->pointer_move({150.0f, 400.0f});   // 0.6
    EXPECT_TRUE(session_->swipe_back_in_flight());
    EXPECT_TRUE(session_->is_transitioning());

    // External return requests are suppressed, the back signal is swallowed.
    EXPECT_FALSE(session_->request_return(ReturnTrigger::Programmatic));
    EXPECT_TRUE(session_->handle_back_signal());
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);

    session_->pointer_up({150.0f, 400.0f});
    session_->update(0.6);
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    session_->update(0.9);

    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
    EXPECT_EQ(session_->active_region(), Region::Center);
    EXPECT_EQ(observer_.events,
              (std::vector<std::string>{"page_changed:Center", "returned_to_center"}));
}

TEST_F(TransitionSessionTest, SwipeBackCancelStaysOnPeripheral)
{
    NavigatorConfig cfg;
    cfg.swipe_back.left = true;
    build(cfg);
    open_left();

    ASSERT_TRUE(session_->pointer_down({390.0f, 400.0f}));
    session_->pointer_move({310.0f, 400.0f});   // 0.2
    session_->pointer_up({310.0f, 400.0f});
    session_->update(0.9);

    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    EXPECT_FALSE(session_->swipe_back_in_flight());
    EXPECT_TRUE(observer_.events.empty());
}

// ─── Return button ──────────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, ReturnButtonTapStartsReturn)
{
    NavigatorConfig cfg;
    cfg.return_button.visible = true;
    build(cfg);
    open_left();

    auto layout = session_->return_button_layout();
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout->center, (Vec2{370.0f, 400.0f}));

    EXPECT_TRUE(session_->pointer_down(layout->center));
    session_->pointer_up(layout->center);
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
    EXPECT_EQ(observer_.haptics, 1);
    EXPECT_FALSE(session_->return_button_layout().has_value());
}

TEST_F(TransitionSessionTest, ReturnButtonPressDraggedOffIsNotATap)
{
    NavigatorConfig cfg;
    cfg.return_button.visible = true;
    build(cfg);
    open_left();

    Vec2 c = session_->return_button_layout()->center;
    ASSERT_TRUE(session_->pointer_down(c));
    session_->pointer_move({c.x, c.y + 100.0f});
    session_->pointer_up({c.x, c.y + 100.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
}

TEST_F(TransitionSessionTest, ReturnButtonTapAbortsOverlappingSwipeBack)
{
    NavigatorConfig cfg;
    cfg.return_button.visible = true;
    cfg.swipe_back.left       = true;
    build(cfg);
    open_left();

    // The button sits inside the swipe-back band of the Left region.
    Vec2 c = session_->return_button_layout()->center;
    ASSERT_TRUE(session_->pointer_down(c));
    session_->pointer_up(c);
    EXPECT_EQ(session_->phase(), SessionPhase::Returning);
}

// ─── Preview ────────────────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, PreviewActiveWhileLockedAndOnCancel)
{
    NavigatorConfig cfg;
    cfg.preview.enabled = true;
    build(cfg);

    ASSERT_TRUE(session_->pointer_down({50.0f, 400.0f}));
    EXPECT_FALSE(session_->preview_active());
    session_->pointer_move({120.0f, 400.0f});
    EXPECT_TRUE(session_->preview_active());

    session_->pointer_move({100.0f, 400.0f});
    session_->pointer_up({100.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingBack);
    EXPECT_TRUE(session_->preview_active());

    session_->update(0.0);
    session_->update(0.5);
    EXPECT_FALSE(session_->preview_active());
}

TEST_F(TransitionSessionTest, PreviewNotShownOnForwardCommit)
{
    NavigatorConfig cfg;
    cfg.preview.enabled = true;
    build(cfg);

    drag_right(200.0f);
    session_->pointer_up({250.0f, 400.0f});
    EXPECT_EQ(session_->phase(), SessionPhase::CommittingForward);
    EXPECT_FALSE(session_->preview_active());
}

// ─── Configuration ──────────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, ConfigOnlyAcceptedWhileIdle)
{
    NavigatorConfig cfg;
    cfg.commit_threshold = 0.5f;

    ASSERT_TRUE(session_->pointer_down({50.0f, 400.0f}));
    EXPECT_FALSE(session_->set_config(cfg));
    session_->pointer_up({50.0f, 400.0f});

    EXPECT_TRUE(session_->set_config(cfg));
    EXPECT_FLOAT_EQ(session_->config().commit_threshold, 0.5f);
}

TEST_F(TransitionSessionTest, CanSwipePredicateGatesCenterDrag)
{
    bool allowed = false;
    session_->set_can_swipe_from_center([&] { return allowed; });
    EXPECT_FALSE(session_->pointer_down({50.0f, 400.0f}));
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);

    allowed = true;
    EXPECT_TRUE(session_->pointer_down({50.0f, 400.0f}));
}

TEST_F(TransitionSessionTest, ThrowingPredicateBlocksDrag)
{
    session_->set_can_swipe_from_center([]() -> bool { throw std::runtime_error("host bug"); });
    EXPECT_FALSE(session_->pointer_down({50.0f, 400.0f}));
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
}

TEST_F(TransitionSessionTest, CenterEntranceFade)
{
    NavigatorConfig cfg;
    cfg.animate_center_entrance  = true;
    cfg.center_entrance_duration = 0.2f;

    TransitionSession s(cfg);
    EXPECT_FLOAT_EQ(s.center_entrance_opacity(), 0.0f);
    s.update(1.0);
    EXPECT_FLOAT_EQ(s.center_entrance_opacity(), 0.0f);
    s.update(1.1);
    EXPECT_NEAR(s.center_entrance_opacity(), ease::ease_in(0.5f), 1e-4f);
    s.update(1.5);
    EXPECT_FLOAT_EQ(s.center_entrance_opacity(), 1.0f);

    EXPECT_FLOAT_EQ(session_->center_entrance_opacity(), 1.0f);
}

// ─── Failure handling ───────────────────────────────────────────────────────

TEST_F(TransitionSessionTest, ThrowingEasingSnapsToNearestEnd)
{
    NavigatorConfig cfg;
    cfg.custom_easing = [](float) -> float { throw std::runtime_error("bad curve"); };
    build(cfg);

    drag_right(240.0f);   // 0.6
    session_->pointer_up({290.0f, 400.0f});
    session_->update(0.1);
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    EXPECT_EQ(session_->active_region(), Region::Left);

    ASSERT_TRUE(session_->request_return(ReturnTrigger::Programmatic));
    session_->update(0.2);
    // Progress was 1 when the failure hit, so the return snaps back.
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    EXPECT_EQ(observer_.count("page_changed:Left"), 2);
}

TEST_F(TransitionSessionTest, ThrowingEasingOnCancelledDragStaysOnCenter)
{
    NavigatorConfig cfg;
    cfg.custom_easing = [](float) -> float { throw std::runtime_error("bad curve"); };
    build(cfg);

    drag_right(280.0f);   // 0.7
    session_->pointer_cancel();
    ASSERT_EQ(session_->phase(), SessionPhase::CommittingBack);

    session_->update(0.1);
    EXPECT_EQ(session_->phase(), SessionPhase::Idle);
    EXPECT_EQ(session_->active_region(), Region::Center);
    EXPECT_FLOAT_EQ(session_->progress(), 0.0f);
    EXPECT_TRUE(observer_.events.empty());
}

namespace
{

// Tries to drive the session from inside a notification.
class ReentrantObserver : public NavigatorObserver
{
   public:
    explicit ReentrantObserver(TransitionSession& s) : session_(s) {}

    void on_region_opened(Region) override
    {
        saw_dispatching = session_.is_dispatching();
        accepted        = session_.request_return(ReturnTrigger::Programmatic)
                   || session_.handle_back_signal();
    }

    bool saw_dispatching = false;
    bool accepted        = true;

   private:
    TransitionSession& session_;
};

class ThrowingObserver : public NavigatorObserver
{
   public:
    void on_page_changed(Region) override { throw std::runtime_error("observer failure"); }
};

}   // anonymous namespace

TEST_F(TransitionSessionTest, CallsFromObserverAreDropped)
{
    ReentrantObserver reentrant(*session_);
    session_->add_observer(&reentrant);

    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    session_->update(0.0);
    session_->update(0.5);

    EXPECT_TRUE(reentrant.saw_dispatching);
    EXPECT_FALSE(reentrant.accepted);
    EXPECT_EQ(session_->phase(), SessionPhase::PeripheralActive);
    EXPECT_FALSE(session_->is_dispatching());
}

TEST_F(TransitionSessionTest, ThrowingObserverDoesNotStopOthers)
{
    ThrowingObserver thrower;
    session_->remove_observer(&observer_);
    session_->add_observer(&thrower);
    session_->add_observer(&observer_);

    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    session_->update(0.0);
    session_->update(0.5);
    EXPECT_EQ(observer_.events,
              (std::vector<std::string>{"page_changed:Left", "region_opened:Left"}));
}

TEST_F(TransitionSessionTest, ObserverRegisteredOnce)
{
    session_->add_observer(&observer_);
    ASSERT_TRUE(session_->begin_programmatic(Direction::Right));
    session_->update(0.0);
    session_->update(0.5);
    EXPECT_EQ(observer_.count("region_opened:Left"), 1);
}
