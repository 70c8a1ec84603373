#pragma once

#include <fivenav/frame.hpp>
#include <fivenav/types.hpp>

namespace fivenav::geometry
{

// Displacement of the element leaving toward the edge the swipe heads to.
// Left → (-w, 0), Right → (w, 0), Up → (0, -h), Down → (0, h).
Vec2 exit_vector(Direction d, Size2 viewport);

// Where the incoming element starts: the mirror image of exit_vector().
Vec2 entry_vector(Direction d, Size2 viewport);

inline float lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

inline Vec2 lerp(Vec2 a, Vec2 b, float t)
{
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t)};
}

struct TransitionStyle
{
    float opacity_floor  = 0.1f;
    float zoom_out_scale = 1.0f;
};

struct TransitionPair
{
    LayerVisual outgoing;
    LayerVisual incoming;
};

// Applies the interpolation contract at parameter t in [0,1]:
//   outgoing offset  = lerp(0, E, t)      incoming offset  = lerp(X, 0, t)
//   outgoing opacity = lerp(1, floor, t)  incoming opacity = lerp(floor, 1, t)
//   outgoing scale   = lerp(1, zoom, t)   incoming scale   = 1
// Content pointers are left null for the caller to fill in.
TransitionPair compose_transition(Direction              d,
                                  float                  t,
                                  Size2                  viewport,
                                  Region                 outgoing,
                                  Region                 incoming,
                                  const TransitionStyle& style);

}   // namespace fivenav::geometry
