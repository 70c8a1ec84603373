#ifdef FIVENAV_USE_IMGUI

    #include "navigator_painter.hpp"

    #include <algorithm>
    #include <imgui.h>
    #include <string_view>

    #include "ui/paint_geometry.hpp"

namespace fivenav
{

namespace
{

ImU32 to_imcol(const Color& c, float opacity = 1.0f)
{
    return IM_COL32(static_cast<int>(std::clamp(c.r, 0.0f, 1.0f) * 255.0f),
                    static_cast<int>(std::clamp(c.g, 0.0f, 1.0f) * 255.0f),
                    static_cast<int>(std::clamp(c.b, 0.0f, 1.0f) * 255.0f),
                    static_cast<int>(std::clamp(c.a * opacity, 0.0f, 1.0f) * 255.0f));
}

ImVec2 to_imvec(Vec2 v)
{
    return ImVec2(v.x, v.y);
}

}   // anonymous namespace

NavigatorPainter::NavigatorPainter()
{
    region_colors_[region_index(Region::Center)] = Color::from_argb(0xFF263238);
    region_colors_[region_index(Region::Left)]   = Color::from_argb(0xFF1565C0);
    region_colors_[region_index(Region::Right)]  = Color::from_argb(0xFF2E7D32);
    region_colors_[region_index(Region::Top)]    = Color::from_argb(0xFF6A1B9A);
    region_colors_[region_index(Region::Bottom)] = Color::from_argb(0xFFEF6C00);
}

void NavigatorPainter::draw(const RenderFrame& frame, const NavigatorConfig& config) const
{
    draw(ImGui::GetForegroundDrawList(), frame, config, {});
}

void NavigatorPainter::draw(ImDrawList*            dl,
                            const RenderFrame&     frame,
                            const NavigatorConfig& config,
                            Vec2                   origin) const
{
    if (!dl || frame.viewport.empty())
        return;

    dl->PushClipRect(to_imvec(origin), to_imvec(origin + Vec2{frame.viewport.width, frame.viewport.height}), true);

    for (const auto& layer : frame.layers)
        draw_layer(dl, layer, frame.viewport, origin);

    if (frame.preview)
        draw_preview(dl, *frame.preview, config.preview, origin);

    if (frame.return_button)
    {
        if (config.return_button.custom_painter)
            config.return_button.custom_painter(*frame.return_button);
        else
            draw_return_button(dl, *frame.return_button, config.return_button, origin);
    }

    dl->PopClipRect();
}

void NavigatorPainter::draw_layer(ImDrawList* dl, const LayerVisual& layer, Size2 viewport, Vec2 origin) const
{
    if (layer.opacity <= 0.0f)
        return;

    auto r = paint::layer_rect(layer, viewport, origin);
    dl->AddRectFilled(to_imvec(r.min()), to_imvec(r.max()), to_imcol(region_colors_[region_index(layer.region)], layer.opacity));

    std::string_view fallback = to_string(layer.region);
    const char*      text     = layer.content && !layer.content->label.empty()
                                    ? layer.content->label.c_str()
                                    : fallback.data();
    ImVec2 ts = ImGui::CalcTextSize(text);
    ImVec2 pos(r.x + (r.w - ts.x) * 0.5f, r.y + (r.h - ts.y) * 0.5f);
    dl->AddText(pos, to_imcol(label_color_, layer.opacity), text);
}

void NavigatorPainter::draw_preview(ImDrawList*          dl,
                                    const PreviewVisual& preview,
                                    const PreviewConfig& config,
                                    Vec2                 origin) const
{
    if (preview.opacity <= 0.0f)
        return;

    ImVec2 ts = ImGui::CalcTextSize(preview.label.c_str());
    auto   r  = paint::preview_chip_rect(
        preview, {ts.x, ts.y}, config.chip_padding_x, config.chip_padding_y, origin);

    dl->AddRectFilled(to_imvec(r.min()),
                      to_imvec(r.max()),
                      to_imcol(config.chip_background, preview.opacity),
                      config.chip_corner_radius * preview.scale);

    // Text is drawn at the font's native size; only the chip scales.
    ImVec2 pos(r.x + (r.w - ts.x) * 0.5f, r.y + (r.h - ts.y) * 0.5f);
    dl->AddText(pos, to_imcol(config.chip_text, preview.opacity), preview.label.c_str());
}

void NavigatorPainter::draw_return_button(ImDrawList*               dl,
                                          const ReturnButtonLayout& layout,
                                          const ReturnButtonConfig& config,
                                          Vec2                      origin) const
{
    Vec2 c = origin + layout.center;
    dl->AddCircleFilled(to_imvec(c), layout.radius, to_imcol(config.background));

    auto pts = paint::chevron_points(layout.glyph, c, config.icon_size * 0.25f);
    ImVec2 im_pts[3] = {to_imvec(pts[0]), to_imvec(pts[1]), to_imvec(pts[2])};
    dl->AddPolyline(im_pts, 3, to_imcol(config.icon), ImDrawFlags_None, 3.0f);
}

}   // namespace fivenav

#endif   // FIVENAV_USE_IMGUI
