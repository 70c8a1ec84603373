#include <gtest/gtest.h>

#include "util/navigator_fixture.hpp"

using namespace fivenav;
using fivenav::test::NavigatorFixture;

// ─── Gesture scenarios ──────────────────────────────────────────────────────

TEST_F(NavigatorFixture, DragFromLeftBandOpensLeft)
{
    drag({50.0f, 400.0f}, {200.0f, 400.0f}, 10, false);
    EXPECT_EQ(nav_->phase(), SessionPhase::Locked);
    EXPECT_FLOAT_EQ(nav_->progress(), 0.375f);

    nav_->pointer_up({200.0f, 400.0f});
    settle();

    EXPECT_EQ(nav_->current_region(), Region::Left);
    EXPECT_EQ(nav_->phase(), SessionPhase::PeripheralActive);
    EXPECT_EQ(observer_.count("page_changed:Left"), 1);
    EXPECT_EQ(observer_.count("region_opened:Left"), 1);
    EXPECT_EQ(observer_.haptics, 1);
}

TEST_F(NavigatorFixture, DragOutsideBandsDoesNothing)
{
    drag({250.0f, 400.0f}, {400.0f, 400.0f});
    settle();

    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_EQ(nav_->phase(), SessionPhase::Idle);
    EXPECT_TRUE(observer_.events.empty());
}

TEST_F(NavigatorFixture, ShortDragSnapsBack)
{
    drag({50.0f, 400.0f}, {100.0f, 400.0f});   // 0.125
    EXPECT_EQ(nav_->phase(), SessionPhase::CommittingBack);
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_TRUE(observer_.events.empty());
}

TEST_F(NavigatorFixture, VerticalDragsReachTopAndBottom)
{
    drag({200.0f, 100.0f}, {200.0f, 400.0f});
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Top);

    ASSERT_TRUE(nav_->return_to_center());
    settle();

    drag({200.0f, 700.0f}, {200.0f, 400.0f});
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Bottom);
}

TEST_F(NavigatorFixture, MissingRegionIsUnreachable)
{
    ASSERT_TRUE(nav_->clear_region(Region::Left));
    drag({50.0f, 400.0f}, {300.0f, 400.0f});
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_FALSE(nav_->navigate(Direction::Right));
}

// ─── Programmatic navigation ────────────────────────────────────────────────

TEST_F(NavigatorFixture, RoundTrip)
{
    open(Direction::Right);
    EXPECT_EQ(nav_->current_region(), Region::Left);

    ASSERT_TRUE(nav_->return_to_center());
    EXPECT_EQ(nav_->phase(), SessionPhase::Returning);
    settle();

    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_EQ(nav_->phase(), SessionPhase::Idle);
    EXPECT_EQ(observer_.events,
              (std::vector<std::string>{
                  "page_changed:Left", "region_opened:Left", "page_changed:Center", "returned_to_center"}));
}

TEST_F(NavigatorFixture, NavigateWhileBusyIsIgnored)
{
    ASSERT_TRUE(nav_->navigate(Direction::Right));
    EXPECT_FALSE(nav_->navigate(Direction::Right));
    EXPECT_FALSE(nav_->navigate(Direction::Left));
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Left);
    EXPECT_FALSE(nav_->navigate(Direction::Left));
    EXPECT_EQ(observer_.count("region_opened:Left"), 1);
}

TEST_F(NavigatorFixture, NavigateToRegion)
{
    ASSERT_TRUE(nav_->navigate_to(Region::Bottom));
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Bottom);

    ASSERT_TRUE(nav_->navigate_to(Region::Center));
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_FALSE(nav_->navigate_to(Region::Center));
}

TEST_F(NavigatorFixture, ProgressStaysInUnitRangeThroughoutTransition)
{
    ASSERT_TRUE(nav_->navigate(Direction::Up));
    while (nav_->is_transitioning())
    {
        tick();
        EXPECT_GE(nav_->progress(), 0.0f);
        EXPECT_LE(nav_->progress(), 1.0f);
    }
    EXPECT_FLOAT_EQ(nav_->progress(), 1.0f);
}

// ─── Back signal ────────────────────────────────────────────────────────────

TEST_F(NavigatorFixture, BackSignalAtCenterIsLeftToHost)
{
    EXPECT_FALSE(nav_->handle_back_signal());
}

TEST_F(NavigatorFixture, BackSignalReturnsFromPeripheral)
{
    open(Direction::Left);
    EXPECT_TRUE(nav_->handle_back_signal());
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_EQ(observer_.count("returned_to_center"), 1);
}

// ─── Swipe-back ─────────────────────────────────────────────────────────────

TEST_F(NavigatorFixture, SwipeBackFromRight)
{
    NavigatorConfig cfg;
    cfg.swipe_back.right = true;
    build(cfg);
    open(Direction::Left);
    ASSERT_EQ(nav_->current_region(), Region::Right);
    observer_.events.clear();

    drag({20.0f, 400.0f}, {260.0f, 400.0f}, 10, false);
    EXPECT_TRUE(nav_->is_transitioning());
    EXPECT_TRUE(nav_->handle_back_signal());
    EXPECT_FALSE(nav_->return_to_center());

    auto f = nav_->frame();
    ASSERT_EQ(f.layers.size(), 2u);
    EXPECT_EQ(f.layers[0].region, Region::Center);
    EXPECT_EQ(f.layers[1].region, Region::Right);
    EXPECT_FLOAT_EQ(f.swipe_back_progress, 0.6f);
    EXPECT_EQ(f.direction, Direction::Right);
    EXPECT_NEAR(f.layers[0].offset.x, -160.0f, 1e-3f);

    nav_->pointer_up({260.0f, 400.0f});
    settle();

    EXPECT_EQ(nav_->phase(), SessionPhase::Idle);
    EXPECT_EQ(nav_->current_region(), Region::Center);
    EXPECT_EQ(observer_.events,
              (std::vector<std::string>{"page_changed:Center", "returned_to_center"}));
}

TEST_F(NavigatorFixture, SwipeBackDisabledByDefault)
{
    open(Direction::Left);
    EXPECT_FALSE(nav_->pointer_down({20.0f, 400.0f}));
    EXPECT_EQ(nav_->session().swipe_back(), nullptr);
}

// ─── Return button ──────────────────────────────────────────────────────────

TEST_F(NavigatorFixture, ReturnButtonShownOnlyWhenSettled)
{
    NavigatorConfig cfg;
    cfg.return_button.visible = true;
    build(cfg);

    EXPECT_FALSE(nav_->frame().return_button.has_value());
    open(Direction::Up);

    auto f = nav_->frame();
    ASSERT_TRUE(f.return_button.has_value());
    EXPECT_EQ(f.return_button->region, Region::Bottom);
    EXPECT_EQ(f.return_button->glyph, Chevron::Up);

    nav_->pointer_down(f.return_button->center);
    nav_->pointer_up(f.return_button->center);
    EXPECT_EQ(nav_->phase(), SessionPhase::Returning);
    EXPECT_FALSE(nav_->frame().return_button.has_value());
    settle();
    EXPECT_EQ(nav_->current_region(), Region::Center);
}

// ─── Frames ─────────────────────────────────────────────────────────────────

TEST_F(NavigatorFixture, IdleFrameShowsCenterOnly)
{
    auto f = nav_->frame();
    ASSERT_EQ(f.layers.size(), 1u);
    EXPECT_EQ(f.layers[0].region, Region::Center);
    ASSERT_NE(f.layers[0].content, nullptr);
    EXPECT_EQ(f.layers[0].content->label, "center");
    EXPECT_FALSE(f.preview.has_value());
}

TEST_F(NavigatorFixture, DragFramePlacesCenterBelowTarget)
{
    drag({50.0f, 400.0f}, {200.0f, 400.0f}, 10, false);
    auto f = nav_->frame();

    ASSERT_EQ(f.layers.size(), 2u);
    EXPECT_EQ(f.layers[0].region, Region::Center);
    EXPECT_EQ(f.layers[1].region, Region::Left);
    EXPECT_NEAR(f.layers[0].offset.x, 150.0f, 1e-3f);
    EXPECT_NEAR(f.layers[1].offset.x, -250.0f, 1e-3f);
    EXPECT_EQ(f.layers[1].content->label, "left");
}

TEST_F(NavigatorFixture, ReturningFrameKeepsCenterBelow)
{
    open(Direction::Down);
    ASSERT_TRUE(nav_->return_to_center());
    tick();

    auto f = nav_->frame();
    ASSERT_EQ(f.layers.size(), 2u);
    EXPECT_EQ(f.layers[0].region, Region::Center);
    EXPECT_EQ(f.layers[1].region, Region::Top);
    EXPECT_EQ(f.direction, Direction::Up);
}

TEST_F(NavigatorFixture, PreviewReplacesMovingContent)
{
    NavigatorConfig cfg;
    cfg.preview.enabled    = true;
    cfg.preview.left_label = "Settings";
    build(cfg);

    drag({50.0f, 400.0f}, {80.0f, 400.0f}, 3, false);
    auto f = nav_->frame();
    ASSERT_EQ(f.layers.size(), 1u);
    EXPECT_EQ(f.layers[0].region, Region::Center);
    EXPECT_EQ(f.layers[0].offset, (Vec2{0.0f, 0.0f}));
    ASSERT_TRUE(f.preview.has_value());
    EXPECT_EQ(f.preview->region, Region::Left);
    EXPECT_EQ(f.preview->label, "Settings");

    nav_->pointer_up({80.0f, 400.0f});
    EXPECT_TRUE(nav_->frame().preview.has_value());
    settle();
    EXPECT_FALSE(nav_->frame().preview.has_value());
}

TEST_F(NavigatorFixture, CenterEntranceFadesIn)
{
    NavigatorConfig cfg;
    cfg.animate_center_entrance = true;
    build(cfg);

    EXPECT_FLOAT_EQ(nav_->frame().layers[0].opacity, 0.0f);
    tick(1.0);
    EXPECT_FLOAT_EQ(nav_->frame().layers[0].opacity, 1.0f);
}

// ─── Regions and config ─────────────────────────────────────────────────────

TEST_F(NavigatorFixture, ClearRegionRules)
{
    EXPECT_FALSE(nav_->clear_region(Region::Center));

    open(Direction::Right);
    EXPECT_FALSE(nav_->clear_region(Region::Left));
    EXPECT_TRUE(nav_->clear_region(Region::Top));
    EXPECT_FALSE(nav_->has_region(Region::Top));
    EXPECT_EQ(nav_->region_content(Region::Top), nullptr);
    EXPECT_NE(nav_->region_content(Region::Left), nullptr);
}

TEST_F(NavigatorFixture, ClearingTargetDuringTransitionIsRefused)
{
    ASSERT_TRUE(nav_->navigate(Direction::Left));
    EXPECT_FALSE(nav_->clear_region(Region::Right));
}

TEST_F(NavigatorFixture, SetConfigSanitizesAndRequiresIdle)
{
    NavigatorConfig cfg;
    cfg.commit_threshold = 5.0f;
    EXPECT_TRUE(nav_->set_config(cfg));
    EXPECT_FLOAT_EQ(nav_->config().commit_threshold, 1.0f);

    ASSERT_TRUE(nav_->navigate(Direction::Right));
    EXPECT_FALSE(nav_->set_config(NavigatorConfig{}));
}

TEST_F(NavigatorFixture, CanSwipePredicateBlocksDrag)
{
    nav_->set_can_swipe_from_center([] { return false; });
    EXPECT_FALSE(nav_->pointer_down({50.0f, 400.0f}));
    // Programmatic navigation is not gated by the predicate.
    EXPECT_TRUE(nav_->navigate(Direction::Right));
}

TEST_F(NavigatorFixture, CallbackObserverForwards)
{
    CallbackObserver cb;
    Region           opened = Region::Center;
    cb.region_opened        = [&](Region r) { opened = r; };
    nav_->add_observer(&cb);

    open(Direction::Up);
    EXPECT_EQ(opened, Region::Bottom);
    nav_->remove_observer(&cb);
}
