#include <fivenav/logger.hpp>
#include <fivenav/navigator.hpp>

#include "frame_composer.hpp"
#include "transition_session.hpp"

namespace fivenav
{

namespace
{

constexpr std::string_view LIBRARY_CATEGORIES[] = {
    "session", "classifier", "swipe_back", "preview", "navigator", "config"};

void apply_log_level(LogLevel level)
{
    auto& logger = Logger::instance();
    for (auto category : LIBRARY_CATEGORIES)
        logger.set_category_level(category, level);
}

}   // anonymous namespace

Navigator::Navigator(const NavigatorConfig& config)
{
    NavigatorConfig cfg = config;
    cfg.sanitize();
    apply_log_level(cfg.log_level);

    session_  = std::make_unique<TransitionSession>(cfg);
    composer_ = std::make_unique<FrameComposer>();
    composer_->set_preview_config(cfg.preview);
}

Navigator::~Navigator() = default;

// ─── Regions ─────────────────────────────────────────────────────────────────

void Navigator::set_region(Region region, RegionContent content)
{
    contents_[region_index(region)] = std::move(content);
    session_->set_region_present(region, true);
}

bool Navigator::clear_region(Region region)
{
    if (region == Region::Center)
    {
        FIVENAV_LOG_WARN("navigator", "Center cannot be cleared");
        return false;
    }
    if (region == session_->active_region()
        || (session_->is_transitioning() && region == session_->target_region()))
    {
        FIVENAV_LOG_WARN("navigator", "{} is in use and cannot be cleared", to_string(region));
        return false;
    }

    contents_[region_index(region)].reset();
    session_->set_region_present(region, false);
    return true;
}

bool Navigator::has_region(Region region) const
{
    return session_->region_present(region);
}

const RegionContent* Navigator::region_content(Region region) const
{
    const auto& content = contents_[region_index(region)];
    return content ? &*content : nullptr;
}

// ─── Setup ───────────────────────────────────────────────────────────────────

void Navigator::set_viewport(Size2 viewport)
{
    session_->set_viewport(viewport);
}

Size2 Navigator::viewport() const
{
    return session_->viewport();
}

const NavigatorConfig& Navigator::config() const
{
    return session_->config();
}

bool Navigator::set_config(NavigatorConfig config)
{
    config.sanitize();
    if (!session_->set_config(config))
        return false;
    composer_->set_preview_config(config.preview);
    apply_log_level(config.log_level);
    return true;
}

void Navigator::set_can_swipe_from_center(std::function<bool()> predicate)
{
    session_->set_can_swipe_from_center(std::move(predicate));
}

void Navigator::add_observer(NavigatorObserver* observer)
{
    session_->add_observer(observer);
}

void Navigator::remove_observer(NavigatorObserver* observer)
{
    session_->remove_observer(observer);
}

// ─── Input and frames ────────────────────────────────────────────────────────

bool Navigator::pointer_down(Vec2 pos)
{
    return session_->pointer_down(pos);
}

void Navigator::pointer_move(Vec2 pos)
{
    session_->pointer_move(pos);
}

void Navigator::pointer_up(Vec2 pos)
{
    session_->pointer_up(pos);
}

void Navigator::pointer_cancel()
{
    session_->pointer_cancel();
}

void Navigator::update(double now_seconds)
{
    session_->update(now_seconds);
}

RenderFrame Navigator::frame() const
{
    return composer_->compose(*session_, contents_);
}

// ─── Navigation ──────────────────────────────────────────────────────────────

bool Navigator::navigate(Direction d)
{
    return session_->begin_programmatic(d);
}

bool Navigator::navigate_to(Region region)
{
    if (region == Region::Center)
        return return_to_center();
    auto d = direction_for_region(region);
    return d && navigate(*d);
}

bool Navigator::return_to_center()
{
    return session_->request_return(ReturnTrigger::Programmatic);
}

bool Navigator::handle_back_signal()
{
    return session_->handle_back_signal();
}

// ─── Queries ─────────────────────────────────────────────────────────────────

Region Navigator::current_region() const
{
    return session_->active_region();
}

SessionPhase Navigator::phase() const
{
    return session_->phase();
}

float Navigator::progress() const
{
    return session_->progress();
}

bool Navigator::is_transitioning() const
{
    return session_->is_transitioning();
}

}   // namespace fivenav
