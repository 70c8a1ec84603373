#include "return_button.hpp"

namespace fivenav::return_button
{

std::optional<ReturnButtonLayout> layout_for(Region                    region,
                                             Size2                     viewport,
                                             const ReturnButtonConfig& config)
{
    if (viewport.empty() || !is_peripheral(region))
        return std::nullopt;

    const float r     = config.button_size * 0.5f;
    const float inset = config.edge_offset + r;
    const float cx    = viewport.width * 0.5f;
    const float cy    = viewport.height * 0.5f;

    ReturnButtonLayout layout;
    layout.region = region;
    layout.radius = r;

    switch (region)
    {
        case Region::Left:
            layout.center = {viewport.width - inset, cy};
            layout.glyph  = Chevron::Right;
            break;
        case Region::Right:
            layout.center = {inset, cy};
            layout.glyph  = Chevron::Left;
            break;
        case Region::Top:
            layout.center = {cx, viewport.height - inset};
            layout.glyph  = Chevron::Down;
            break;
        case Region::Bottom:
            layout.center = {cx, inset};
            layout.glyph  = Chevron::Up;
            break;
        case Region::Center:
            return std::nullopt;
    }
    return layout;
}

bool hit_test(const ReturnButtonLayout& layout, Vec2 pos)
{
    Vec2 d = pos - layout.center;
    return d.x * d.x + d.y * d.y <= layout.radius * layout.radius;
}

}   // namespace fivenav::return_button
