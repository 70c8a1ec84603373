#include "paint_geometry.hpp"

namespace fivenav::paint
{

Rect layer_rect(const LayerVisual& layer, Size2 viewport, Vec2 origin)
{
    const float w = viewport.width * layer.scale;
    const float h = viewport.height * layer.scale;

    Rect r;
    r.x = origin.x + layer.offset.x + (viewport.width - w) * 0.5f;
    r.y = origin.y + layer.offset.y + (viewport.height - h) * 0.5f;
    r.w = w;
    r.h = h;
    return r;
}

Rect preview_chip_rect(const PreviewVisual& preview,
                       Vec2                 text_size,
                       float                padding_x,
                       float                padding_y,
                       Vec2                 origin)
{
    const float w  = (text_size.x + 2.0f * padding_x) * preview.scale;
    const float h  = (text_size.y + 2.0f * padding_y) * preview.scale;
    const Vec2  cc = origin + preview.anchor + preview.jitter;

    // Keep the chip inside the viewport: anchors sit on an edge, so push the
    // chip inward along the swipe axis by half its extent.
    Vec2 center = cc;
    switch (preview.region)
    {
        case Region::Left:
            center.x += w * 0.5f;
            break;
        case Region::Right:
            center.x -= w * 0.5f;
            break;
        case Region::Top:
            center.y += h * 0.5f;
            break;
        case Region::Bottom:
            center.y -= h * 0.5f;
            break;
        case Region::Center:
            break;
    }
    return Rect{center.x - w * 0.5f, center.y - h * 0.5f, w, h};
}

std::array<Vec2, 3> chevron_points(Chevron glyph, Vec2 c, float e)
{
    // Arms span 2e across the pointing axis and e along it.
    const float s = e;
    const float d = e * 0.5f;

    switch (glyph)
    {
        case Chevron::Left:
            return {Vec2{c.x + d, c.y - s}, Vec2{c.x - d, c.y}, Vec2{c.x + d, c.y + s}};
        case Chevron::Right:
            return {Vec2{c.x - d, c.y - s}, Vec2{c.x + d, c.y}, Vec2{c.x - d, c.y + s}};
        case Chevron::Up:
            return {Vec2{c.x - s, c.y + d}, Vec2{c.x, c.y - d}, Vec2{c.x + s, c.y + d}};
        case Chevron::Down:
            return {Vec2{c.x - s, c.y - d}, Vec2{c.x, c.y + d}, Vec2{c.x + s, c.y - d}};
    }
    return {c, c, c};
}

}   // namespace fivenav::paint
