#include <algorithm>
#include <cmath>
#include <fivenav/easing.hpp>

namespace fivenav
{

namespace ease
{

float linear(float t)
{
    return t;
}

float ease_in(float t)
{
    // Cubic ease-in
    return t * t * t;
}

float ease_out(float t)
{
    // Cubic ease-out
    float u = 1.0f - t;
    return 1.0f - u * u * u;
}

float ease_in_out(float t)
{
    // Cubic ease-in-out
    if (t < 0.5f)
    {
        return 4.0f * t * t * t;
    }
    else
    {
        float u = -2.0f * t + 2.0f;
        return 1.0f - u * u * u / 2.0f;
    }
}

float decelerate(float t)
{
    return 1.0f - (1.0f - t) * (1.0f - t);
}

float CubicBezier::operator()(float t) const
{
    // Newton-Raphson: find u with bezier_x(u) == t, then return bezier_y(u)
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    float u = t;
    for (int i = 0; i < 8; ++i)
    {
        float u2   = u * u;
        float u3   = u2 * u;
        float inv  = 1.0f - u;
        float inv2 = inv * inv;

        float bx = 3.0f * inv2 * u * x1 + 3.0f * inv * u2 * x2 + u3;
        float dx = 3.0f * inv2 * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u2 * (1.0f - x2);

        if (std::abs(dx) < 1e-7f)
            break;
        u -= (bx - t) / dx;
        u = std::clamp(u, 0.0f, 1.0f);
    }

    float inv  = 1.0f - u;
    float inv2 = inv * inv;
    float u2   = u * u;
    return 3.0f * inv2 * u * y1 + 3.0f * inv * u2 * y2 + u2 * u;
}

}  // namespace ease

EasingFunc easing_for(EasingKind kind)
{
    switch (kind)
    {
        case EasingKind::Linear:
            return ease::linear;
        case EasingKind::EaseIn:
            return ease::ease_in;
        case EasingKind::EaseOut:
            return ease::ease_out;
        case EasingKind::EaseInOut:
            return ease::ease_in_out;
        case EasingKind::Decelerate:
            return ease::decelerate;
        case EasingKind::FastOutSlowIn:
            return ease::fast_out_slow_in;
    }
    return ease::ease_out;
}

std::string_view to_string(EasingKind kind)
{
    switch (kind)
    {
        case EasingKind::Linear:
            return "linear";
        case EasingKind::EaseIn:
            return "ease_in";
        case EasingKind::EaseOut:
            return "ease_out";
        case EasingKind::EaseInOut:
            return "ease_in_out";
        case EasingKind::Decelerate:
            return "decelerate";
        case EasingKind::FastOutSlowIn:
            return "fast_out_slow_in";
    }
    return "ease_out";
}

std::optional<EasingKind> easing_from_string(std::string_view name)
{
    if (name == "linear")
        return EasingKind::Linear;
    if (name == "ease_in")
        return EasingKind::EaseIn;
    if (name == "ease_out")
        return EasingKind::EaseOut;
    if (name == "ease_in_out")
        return EasingKind::EaseInOut;
    if (name == "decelerate")
        return EasingKind::Decelerate;
    if (name == "fast_out_slow_in")
        return EasingKind::FastOutSlowIn;
    return std::nullopt;
}

}  // namespace fivenav
