#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fivenav
{

// One of the five content slots. Center is the hub of a star topology:
// every peripheral is reached from Center and returns to Center.
enum class Region : uint8_t
{
    Center = 0,
    Left,
    Right,
    Top,
    Bottom,
};

inline constexpr size_t REGION_COUNT = 5;

inline constexpr std::array<Region, 4> PERIPHERAL_REGIONS = {
    Region::Left, Region::Right, Region::Top, Region::Bottom};

// Heading of a drag. Named after the finger's motion, which is the opposite
// of the region it reveals: a Left swipe pulls the Right region in.
enum class Direction : uint8_t
{
    Left = 0,
    Right,
    Up,
    Down,
};

enum class Axis : uint8_t
{
    Horizontal,
    Vertical,
};

enum class HapticIntensity : uint8_t
{
    Soft,
    Medium,
    Heavy,
};

enum class SessionPhase : uint8_t
{
    Idle,                // Center settled, progress 0
    Dragging,            // Pointer down, direction not locked yet
    Locked,              // Direction locked, progress follows the pointer
    CommittingForward,   // Animating toward the peripheral region
    CommittingBack,      // Animating back to Center after a cancelled drag
    PeripheralActive,    // Peripheral settled, progress held at 1
    Returning,           // Animating from a peripheral back to Center
};

// Source of an external request to leave the active peripheral region.
enum class ReturnTrigger : uint8_t
{
    Button,
    Programmatic,
    PlatformBack,
};

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    constexpr Vec2 operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2 operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
    constexpr Vec2 operator-() const { return {-x, -y}; }
    constexpr Vec2 operator*(float s) const { return {x * s, y * s}; }
    constexpr bool operator==(const Vec2&) const = default;
};

struct Size2
{
    float width  = 0.0f;
    float height = 0.0f;

    constexpr bool empty() const { return width <= 0.0f || height <= 0.0f; }
    constexpr bool contains(Vec2 p) const
    {
        return p.x >= 0.0f && p.y >= 0.0f && p.x <= width && p.y <= height;
    }
    constexpr bool operator==(const Size2&) const = default;
};

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // 0xAARRGGBB, the layout most design tools export.
    static constexpr Color from_argb(uint32_t argb)
    {
        return Color{static_cast<float>((argb >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((argb >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(argb & 0xFF) / 255.0f,
                     static_cast<float>((argb >> 24) & 0xFF) / 255.0f};
    }
    uint32_t to_argb() const;
};

// Presence flag per region, indexed by region_index().
using RegionMask = std::array<bool, REGION_COUNT>;

// ─── Region / Direction mapping ──────────────────────────────────────────────

// Region pulled into view by a swipe in direction d.
Region revealed_region(Direction d);

// Swipe direction that reveals r; nullopt for Center.
std::optional<Direction> direction_for_region(Region r);

Direction opposite(Direction d);
Axis      axis_of(Direction d);

// -1 for Left/Up, +1 for Right/Down.
float direction_sign(Direction d);

bool is_peripheral(Region r);

inline constexpr size_t region_index(Region r)
{
    return static_cast<size_t>(r);
}

std::string_view to_string(Region r);
std::string_view to_string(Direction d);
std::string_view to_string(SessionPhase p);
std::string_view to_string(HapticIntensity h);
std::string_view to_string(ReturnTrigger t);

std::optional<HapticIntensity> haptic_from_string(std::string_view name);

}   // namespace fivenav
