#include "preview_overlay.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "geometry_mapper.hpp"

namespace fivenav
{

float PreviewOverlayEngine::appearance_ratio(float progress, float appearance_threshold)
{
    if (appearance_threshold <= 0.0f)
        return progress > 0.0f ? 1.0f : 0.0f;
    return std::clamp(progress / appearance_threshold, 0.0f, 1.0f);
}

float PreviewOverlayEngine::overscroll_ratio(float progress, float commit_threshold)
{
    if (progress <= commit_threshold || commit_threshold >= 1.0f)
        return 0.0f;
    return std::clamp((progress - commit_threshold) / (1.0f - commit_threshold), 0.0f, 1.0f);
}

Vec2 PreviewOverlayEngine::anchor_for(Direction d, Size2 viewport) const
{
    const float inset = config_.offset_from_edge;
    const float cx    = viewport.width * 0.5f;
    const float cy    = viewport.height * 0.5f;

    switch (revealed_region(d))
    {
        case Region::Left:
            return {inset, cy};
        case Region::Right:
            return {viewport.width - inset, cy};
        case Region::Top:
            return {cx, inset};
        case Region::Bottom:
            return {cx, viewport.height - inset};
        case Region::Center:
            break;
    }
    return {cx, cy};
}

PreviewVisual PreviewOverlayEngine::compute(Direction d,
                                            float     progress,
                                            float     commit_threshold,
                                            Size2     viewport,
                                            double    wall_clock) const
{
    progress = std::clamp(progress, 0.0f, 1.0f);

    PreviewVisual v;
    v.direction = d;
    v.region    = revealed_region(d);
    v.label     = config_.label_for(v.region);
    v.anchor    = anchor_for(d, viewport);

    v.appearance_ratio = appearance_ratio(progress, config_.appearance_threshold);
    v.overscroll_ratio = overscroll_ratio(progress, commit_threshold);

    v.opacity = v.appearance_ratio;
    v.scale   = geometry::lerp(config_.min_scale, config_.max_scale, v.appearance_ratio);
    v.scale *= geometry::lerp(1.0f, config_.overscroll_scale_ceiling, v.overscroll_ratio);

    if (v.overscroll_ratio > 0.0f)
    {
        const double phase = 2.0 * std::numbers::pi * config_.shake_frequency * wall_clock;
        const float  j = config_.shake_amplitude * v.overscroll_ratio * static_cast<float>(std::sin(phase));
        // Shake across the swipe axis so it reads as resistance, not motion.
        v.jitter = axis_of(d) == Axis::Horizontal ? Vec2{0.0f, j} : Vec2{j, 0.0f};
    }
    return v;
}

}   // namespace fivenav
