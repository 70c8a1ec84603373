#pragma once

#include <fivenav/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fivenav
{

// Host-supplied content for one region. The navigator never looks inside
// user_data; it only threads the pointer through to the render description.
struct RegionContent
{
    std::string label;
    void*       user_data = nullptr;
};

// One region's placement for the current frame. Offsets are relative to the
// viewport origin; scale is uniform about the viewport center.
struct LayerVisual
{
    Region               region  = Region::Center;
    Vec2                 offset  = {};
    float                opacity = 1.0f;
    float                scale   = 1.0f;
    const RegionContent* content = nullptr;
};

// Preview card shown while dragging from Center with previews enabled.
struct PreviewVisual
{
    Region      region    = Region::Center;   // region being previewed
    Direction   direction = Direction::Left;
    std::string label;
    Vec2        anchor = {};   // point on the revealed edge, inset by offset_from_edge
    Vec2        jitter = {};   // resistance shake, perpendicular to the swipe axis
    float       opacity          = 0.0f;
    float       scale            = 1.0f;
    float       appearance_ratio = 0.0f;
    float       overscroll_ratio = 0.0f;
};

enum class Chevron : uint8_t
{
    Left,
    Right,
    Up,
    Down,
};

struct ReturnButtonLayout
{
    Region  region = Region::Center;
    Vec2    center = {};
    float   radius = 0.0f;
    Chevron glyph  = Chevron::Left;
};

// Everything a host renderer needs to draw one frame. Layers are ordered
// back to front.
struct RenderFrame
{
    SessionPhase             phase         = SessionPhase::Idle;
    Region                   active_region = Region::Center;
    float                    progress      = 0.0f;
    std::optional<Direction> direction;
    Size2                    viewport;

    std::vector<LayerVisual>          layers;
    std::optional<PreviewVisual>      preview;
    std::optional<ReturnButtonLayout> return_button;

    float swipe_back_progress = 0.0f;

    const LayerVisual* layer(Region r) const
    {
        for (const auto& l : layers)
        {
            if (l.region == r)
                return &l;
        }
        return nullptr;
    }
};

}   // namespace fivenav
