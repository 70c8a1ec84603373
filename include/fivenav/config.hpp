#pragma once

#include <fivenav/easing.hpp>
#include <fivenav/frame.hpp>
#include <fivenav/logger.hpp>
#include <fivenav/types.hpp>
#include <functional>
#include <string>

namespace fivenav
{

// Edge bands a drag from Center must start in to be eligible for a direction.
struct DetectionZone
{
    float horizontal_band_width = 100.0f;   // left/right bands, pixels
    float vertical_band_height  = 200.0f;   // top/bottom bands, pixels
};

struct PreviewConfig
{
    bool enabled = false;

    float appearance_threshold     = 0.15f;   // progress at which the card is fully shown
    float min_scale                = 0.8f;
    float max_scale                = 1.0f;
    float overscroll_scale_ceiling = 1.1f;    // extra scale reached at progress 1
    float shake_amplitude          = 4.0f;    // pixels
    float shake_frequency          = 6.0f;    // Hz
    float offset_from_edge         = 20.0f;

    std::string left_label   = "Left";
    std::string right_label  = "Right";
    std::string top_label    = "Top";
    std::string bottom_label = "Bottom";

    Color chip_background    = Color::from_argb(0xCC424242);
    Color chip_text          = Color{1.0f, 1.0f, 1.0f, 1.0f};
    float chip_padding_x     = 16.0f;
    float chip_padding_y     = 8.0f;
    float chip_corner_radius = 20.0f;

    const std::string& label_for(Region r) const;
};

struct ReturnButtonConfig
{
    bool  visible     = false;
    Color background  = Color::from_argb(0x66000000);
    Color icon        = Color{1.0f, 1.0f, 1.0f, 1.0f};
    float button_size = 48.0f;
    float icon_size   = 30.0f;
    float edge_offset = 6.0f;

    // When set, renderers hand the layout to this hook instead of drawing
    // the default circular button. Not persisted.
    std::function<void(const ReturnButtonLayout&)> custom_painter;
};

struct SwipeBackConfig
{
    bool left   = false;
    bool right  = false;
    bool top    = false;
    bool bottom = false;

    // Fraction of the viewport dimension, measured from the edge the
    // swipe-back must start at.
    float edge_fraction = 0.2f;

    bool enabled_for(Region r) const;
    void set_enabled(Region r, bool enabled);
};

// Complete configuration surface of a Navigator. Every field has a usable
// default; JSON persistence covers the scalar fields only (callables are
// never serialized).
struct NavigatorConfig
{
    float         commit_threshold = 0.25f;
    DetectionZone detection;

    float      transition_duration = 0.3f;   // seconds, forward commit and cancel
    float      return_duration     = 0.3f;   // seconds, Returning phase
    EasingKind easing_kind         = EasingKind::EaseOut;
    EasingFunc custom_easing;                // overrides easing_kind when set

    float zoom_out_scale = 1.0f;   // scale of the backgrounded region at progress 1
    float opacity_floor  = 0.1f;

    SwipeBackConfig    swipe_back;
    PreviewConfig      preview;
    ReturnButtonConfig return_button;

    HapticIntensity haptic = HapticIntensity::Heavy;

    bool  animate_center_entrance  = false;
    float center_entrance_duration = 0.2f;

    LogLevel log_level = LogLevel::Info;

    EasingFunc easing() const;

    // Clamp out-of-range values in place. Returns true if anything changed.
    bool sanitize();

    std::string serialize() const;

    // Parses JSON produced by serialize(). Missing keys keep their current
    // values and unknown keys are ignored. Returns false on malformed input,
    // leaving the config untouched.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/fivenav/navigator.json
    static std::string default_path();
};

}   // namespace fivenav
