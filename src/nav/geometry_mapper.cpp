#include "geometry_mapper.hpp"

#include <algorithm>

namespace fivenav::geometry
{

Vec2 exit_vector(Direction d, Size2 viewport)
{
    switch (d)
    {
        case Direction::Left:
            return {-viewport.width, 0.0f};
        case Direction::Right:
            return {viewport.width, 0.0f};
        case Direction::Up:
            return {0.0f, -viewport.height};
        case Direction::Down:
            return {0.0f, viewport.height};
    }
    return {};
}

Vec2 entry_vector(Direction d, Size2 viewport)
{
    return -exit_vector(d, viewport);
}

TransitionPair compose_transition(Direction              d,
                                  float                  t,
                                  Size2                  viewport,
                                  Region                 outgoing,
                                  Region                 incoming,
                                  const TransitionStyle& style)
{
    t = std::clamp(t, 0.0f, 1.0f);

    TransitionPair pair;

    pair.outgoing.region  = outgoing;
    pair.outgoing.offset  = lerp(Vec2{}, exit_vector(d, viewport), t);
    pair.outgoing.opacity = lerp(1.0f, style.opacity_floor, t);
    pair.outgoing.scale   = lerp(1.0f, style.zoom_out_scale, t);

    pair.incoming.region  = incoming;
    pair.incoming.offset  = lerp(entry_vector(d, viewport), Vec2{}, t);
    pair.incoming.opacity = lerp(style.opacity_floor, 1.0f, t);
    pair.incoming.scale   = 1.0f;

    return pair;
}

}   // namespace fivenav::geometry
