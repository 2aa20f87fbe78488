#pragma once

#ifdef WEDGE_USE_IMGUI

    #include <imgui.h>
    #include <wedge/draw_context.hpp>

namespace wedge
{

// DrawContext over an ImDrawList. Logical coordinates are offset by the
// screen-space origin of the chart item. ImGui applies DisplayFramebufferScale
// when it rasterizes, so the scale is recorded but not applied here again.
class ImGuiDrawContext : public DrawContext
{
   public:
    ImGuiDrawContext() = default;

    // Must be called every frame before drawing: draw lists are per frame.
    void bind(ImDrawList* draw_list, ImVec2 origin, ImFont* font = nullptr, float font_size = 0.0f);

    void  set_backing_size(uint32_t width_px, uint32_t height_px) override;
    void  set_display_size(float width, float height) override;
    void  set_scale(float scale) override { scale_ = scale; }
    float scale() const override { return scale_; }

    // Immediate mode redraws from scratch every frame; there is nothing to erase.
    void clear_rect(float, float, float, float) override {}

    void fill_circle(float cx, float cy, float radius, Rgb color) override;
    void fill_wedge(float cx,
                    float cy,
                    float radius,
                    float start_angle,
                    float end_angle,
                    Rgb   color) override;
    void fill_text(std::string_view text, float x, float y, Rgb color) override;

    float measure_text(std::string_view text) const override;

    ImVec2 origin() const { return origin_; }
    ImVec2 display_size() const { return display_size_; }

   private:
    ImFont* active_font() const;
    float   active_font_size() const;

    ImDrawList* draw_list_    = nullptr;
    ImVec2      origin_       = ImVec2(0.0f, 0.0f);
    ImVec2      display_size_ = ImVec2(0.0f, 0.0f);
    ImFont*     font_         = nullptr;
    float       font_size_    = 0.0f;
    float       scale_        = 1.0f;
};

ImU32 to_imgui_color(Rgb color, float alpha = 1.0f);

// Top edge for text drawn with `font` at `size` so its baseline lands on
// `baseline`.
float text_top_from_baseline(const ImFont* font, float size, float baseline);

}   // namespace wedge

#endif   // WEDGE_USE_IMGUI
