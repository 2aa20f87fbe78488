#ifdef WEDGE_USE_IMGUI

    #include "imgui_draw_context.hpp"

    #include <algorithm>
    #include <cfloat>
    #include <cmath>
    #include <numbers>
    #include <string>

namespace wedge
{

ImU32 to_imgui_color(Rgb color, float alpha)
{
    int a = static_cast<int>(std::clamp(alpha, 0.0f, 1.0f) * 255.0f);
    return IM_COL32(static_cast<int>(red(color)),
                    static_cast<int>(green(color)),
                    static_cast<int>(blue(color)),
                    a);
}

float text_top_from_baseline(const ImFont* font, float size, float baseline)
{
    // Callers pass the baseline; ImGui positions text by its top edge.
    if (!font || font->FontSize <= 0.0f)
        return baseline - size;
    return baseline - font->Ascent * size / font->FontSize;
}

void ImGuiDrawContext::bind(ImDrawList* draw_list, ImVec2 origin, ImFont* font, float font_size)
{
    draw_list_ = draw_list;
    origin_    = origin;
    font_      = font;
    font_size_ = font_size;
}

void ImGuiDrawContext::set_backing_size(uint32_t /*width_px*/, uint32_t /*height_px*/)
{
    // The backing store is ImGui's framebuffer; it is owned by the platform backend.
}

void ImGuiDrawContext::set_display_size(float width, float height)
{
    display_size_ = ImVec2(width, height);
}

ImFont* ImGuiDrawContext::active_font() const
{
    return font_ ? font_ : ImGui::GetFont();
}

float ImGuiDrawContext::active_font_size() const
{
    return font_size_ > 0.0f ? font_size_ : ImGui::GetFontSize();
}

void ImGuiDrawContext::fill_circle(float cx, float cy, float radius, Rgb color)
{
    if (!draw_list_ || radius <= 0.0f)
        return;
    draw_list_->AddCircleFilled(ImVec2(origin_.x + cx, origin_.y + cy), radius,
                                to_imgui_color(color), 0);
}

void ImGuiDrawContext::fill_wedge(float cx,
                                  float cy,
                                  float radius,
                                  float start_angle,
                                  float end_angle,
                                  Rgb   color)
{
    if (!draw_list_ || radius <= 0.0f || end_angle <= start_angle)
        return;

    // PathFillConvex needs convex polygons: fan the wedge out in quarter turns.
    constexpr float max_step = std::numbers::pi_v<float> * 0.5f;
    const ImVec2    center(origin_.x + cx, origin_.y + cy);
    const ImU32     col = to_imgui_color(color);

    float a0 = start_angle;
    while (a0 < end_angle)
    {
        float a1 = std::min(a0 + max_step, end_angle);
        draw_list_->PathLineTo(center);
        draw_list_->PathArcTo(center, radius, a0, a1);
        draw_list_->PathFillConvex(col);
        a0 = a1;
    }
}

void ImGuiDrawContext::fill_text(std::string_view text, float x, float y, Rgb color)
{
    if (!draw_list_ || text.empty())
        return;

    ImFont* font = active_font();
    float   size = active_font_size();
    float   top  = text_top_from_baseline(font, size, y);
    draw_list_->AddText(font,
                        size,
                        ImVec2(origin_.x + x, origin_.y + top),
                        to_imgui_color(color),
                        text.data(),
                        text.data() + text.size());
}

float ImGuiDrawContext::measure_text(std::string_view text) const
{
    if (text.empty())
        return 0.0f;
    ImFont* font = active_font();
    if (!font)
        return 0.0f;
    return font->CalcTextSizeA(active_font_size(), FLT_MAX, 0.0f, text.data(),
                               text.data() + text.size())
        .x;
}

}   // namespace wedge

#endif   // WEDGE_USE_IMGUI
