#pragma once

#include <functional>
#include <optional>
#include <string_view>

namespace fivenav
{

namespace ease
{
float linear(float t);
float ease_in(float t);
float ease_out(float t);
float ease_in_out(float t);
float decelerate(float t);

// Cubic-bezier easing factory (returns a stateless function object)
struct CubicBezier
{
    float x1, y1, x2, y2;
    float operator()(float t) const;
};

// Material "standard" curves, handy for matching platform motion.
inline constexpr CubicBezier fast_out_slow_in{0.4f, 0.0f, 0.2f, 1.0f};
inline constexpr CubicBezier ease_out_cubic{0.215f, 0.61f, 0.355f, 1.0f};
}  // namespace ease

using EasingFn = float (*)(float);

// Accepts free functions and stateful objects alike (CubicBezier).
using EasingFunc = std::function<float(float)>;

// Named curves, used by the JSON configuration.
enum class EasingKind
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Decelerate,
    FastOutSlowIn,
};

EasingFunc                easing_for(EasingKind kind);
std::string_view          to_string(EasingKind kind);
std::optional<EasingKind> easing_from_string(std::string_view name);

}  // namespace fivenav
