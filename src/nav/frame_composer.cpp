#include "frame_composer.hpp"

#include "geometry_mapper.hpp"
#include "transition_session.hpp"

namespace fivenav
{

namespace
{

LayerVisual settled_layer(Region r)
{
    LayerVisual l;
    l.region = r;
    return l;
}

}   // anonymous namespace

RenderFrame FrameComposer::compose(const TransitionSession& session, const RegionContents& contents) const
{
    const NavigatorConfig& cfg = session.config();

    RenderFrame f;
    f.phase         = session.phase();
    f.active_region = session.active_region();
    f.progress      = session.progress();
    f.direction     = session.direction();
    f.viewport      = session.viewport();

    const geometry::TransitionStyle style{cfg.opacity_floor, cfg.zoom_out_scale};

    switch (f.phase)
    {
        case SessionPhase::Idle:
        case SessionPhase::Dragging:
            f.layers.push_back(settled_layer(Region::Center));
            break;

        case SessionPhase::Locked:
        case SessionPhase::CommittingForward:
        case SessionPhase::CommittingBack:
        {
            auto reveal = session.reveal_direction();
            if (!reveal)
            {
                f.layers.push_back(settled_layer(Region::Center));
                break;
            }
            if (session.preview_active())
            {
                f.layers.push_back(settled_layer(Region::Center));
                f.preview = preview_.compute(*reveal, f.progress, cfg.commit_threshold, f.viewport, session.now());
                break;
            }
            auto pair = geometry::compose_transition(
                *reveal, f.progress, f.viewport, Region::Center, session.target_region(), style);
            f.layers.push_back(pair.outgoing);
            f.layers.push_back(pair.incoming);
            break;
        }

        case SessionPhase::PeripheralActive:
        {
            const auto* sb = session.swipe_back();
            f.swipe_back_progress = sb ? sb->progress() : 0.0f;
            if (sb && f.swipe_back_progress > 0.0f)
            {
                f.direction = sb->return_direction();
                auto pair   = geometry::compose_transition(sb->return_direction(),
                                                         f.swipe_back_progress,
                                                         f.viewport,
                                                         f.active_region,
                                                         Region::Center,
                                                         style);
                f.layers.push_back(pair.incoming);
                f.layers.push_back(pair.outgoing);
            }
            else
            {
                f.layers.push_back(settled_layer(f.active_region));
            }
            f.return_button = session.return_button_layout();
            break;
        }

        case SessionPhase::Returning:
        {
            auto dir = session.direction();
            if (!dir)
            {
                f.layers.push_back(settled_layer(Region::Center));
                break;
            }
            auto pair = geometry::compose_transition(
                *dir, 1.0f - f.progress, f.viewport, f.active_region, Region::Center, style);
            f.layers.push_back(pair.incoming);
            f.layers.push_back(pair.outgoing);
            break;
        }
    }

    const float fade = session.center_entrance_opacity();
    for (auto& layer : f.layers)
    {
        if (layer.region == Region::Center)
            layer.opacity *= fade;
        const auto& content = contents[region_index(layer.region)];
        layer.content       = content ? &*content : nullptr;
    }
    return f;
}

}   // namespace fivenav
