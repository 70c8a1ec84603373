#pragma once

#include <array>
#include <fivenav/frame.hpp>

namespace fivenav::paint
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    Vec2 min() const { return {x, y}; }
    Vec2 max() const { return {x + w, y + h}; }
};

// Screen rectangle of a layer: the viewport shifted by the layer offset and
// scaled uniformly about the viewport center.
Rect layer_rect(const LayerVisual& layer, Size2 viewport, Vec2 origin = {});

// Background chip of the preview card for a text block of text_size,
// centred on anchor + jitter and scaled by the card scale.
Rect preview_chip_rect(const PreviewVisual& preview,
                       Vec2                 text_size,
                       float                padding_x,
                       float                padding_y,
                       Vec2                 origin = {});

// Open chevron polyline (three points) of the given half-extent, pointing in
// the glyph's direction.
std::array<Vec2, 3> chevron_points(Chevron glyph, Vec2 center, float half_extent);

}   // namespace fivenav::paint
