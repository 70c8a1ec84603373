#pragma once

#ifdef FIVENAV_USE_IMGUI

    #include <array>
    #include <fivenav/config.hpp>
    #include <fivenav/frame.hpp>

struct ImDrawList;

namespace fivenav
{

// Draws a RenderFrame with Dear ImGui draw-list primitives. Each region is
// a filled panel with its content label; the preview card and the return
// button are drawn on top. Call inside an ImGui frame.
class NavigatorPainter
{
   public:
    NavigatorPainter();

    void set_region_color(Region r, Color c) { region_colors_[region_index(r)] = c; }
    void set_label_color(Color c) { label_color_ = c; }

    // Uses the foreground draw list of the current ImGui frame.
    void draw(const RenderFrame& frame, const NavigatorConfig& config) const;

    void draw(ImDrawList* dl, const RenderFrame& frame, const NavigatorConfig& config, Vec2 origin) const;

   private:
    void draw_layer(ImDrawList* dl, const LayerVisual& layer, Size2 viewport, Vec2 origin) const;
    void draw_preview(ImDrawList* dl, const PreviewVisual& preview, const PreviewConfig& config, Vec2 origin) const;
    void draw_return_button(ImDrawList*               dl,
                            const ReturnButtonLayout& layout,
                            const ReturnButtonConfig& config,
                            Vec2                      origin) const;

    std::array<Color, REGION_COUNT> region_colors_;
    Color                           label_color_{1.0f, 1.0f, 1.0f, 1.0f};
};

}   // namespace fivenav

#endif   // FIVENAV_USE_IMGUI
