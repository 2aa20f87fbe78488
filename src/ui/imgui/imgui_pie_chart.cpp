#ifdef WEDGE_USE_IMGUI

    #include "imgui_pie_chart.hpp"

    #include <algorithm>
    #include <cfloat>
    #include <memory>
    #include <wedge/logger.hpp>

    #include "imgui_draw_context.hpp"

namespace wedge
{

ImGuiPieChart::ImGuiPieChart(const ChartConfig& config) : surface_(config)
{
    auto ctx = std::make_unique<ImGuiDrawContext>();
    context_ = ctx.get();
    if (!surface_.initialize(*this, std::move(ctx)))
    {
        WEDGE_LOG_ERROR("imgui", "Failed to initialize pie chart surface");
        context_ = nullptr;
    }
}

bool ImGuiPieChart::draw(const char* id, const ValueSet& values, const ColorPair& colors, ImVec2 size)
{
    ImVec2 avail = ImGui::GetContentRegionAvail();
    if (size.x <= 0.0f)
        size.x = avail.x;
    if (size.y <= 0.0f)
        size.y = avail.y;
    size.x = std::max(size.x, 1.0f);
    size.y = std::max(size.y, 1.0f);

    ImVec2 origin = ImGui::GetCursorScreenPos();
    ImGui::InvisibleButton(id, size);
    bool hovered = ImGui::IsItemHovered();

    if (!context_)
        return hovered;

    box_ = ContentBox{origin.x, origin.y, size.x, size.y};

    const ImGuiIO& io = ImGui::GetIO();
    context_->bind(ImGui::GetWindowDrawList(), origin, nullptr, surface_.config().font_size);
    surface_.resize(io.DisplayFramebufferScale.x);
    surface_.clear();
    surface_.render(values, colors);

    if (hovered)
        surface_.on_pointer_move(PointerEvent{io.MousePos.x, io.MousePos.y});
    else
        surface_.on_pointer_leave();

    draw_tooltip();
    return hovered;
}

void ImGuiPieChart::draw_tooltip() const
{
    const TooltipState& tip = surface_.tooltip();
    if (!tip.visible)
        return;

    constexpr float pad = 3.0f;

    ImFont*     font = ImGui::GetFont();
    float       size = surface_.config().font_size * tip.font_scale;
    ImVec2      pos(box_.x + tip.left, box_.y + tip.top);
    ImVec2      text_size = font->CalcTextSizeA(size, FLT_MAX, 0.0f, tip.text.c_str());
    ImDrawList* fg        = ImGui::GetForegroundDrawList();

    fg->AddRectFilled(ImVec2(pos.x - pad, pos.y - pad),
                      ImVec2(pos.x + text_size.x + pad, pos.y + text_size.y + pad),
                      to_imgui_color(0xFFFFFF, 0.9f),
                      2.0f);
    fg->AddText(font, size, pos, to_imgui_color(surface_.config().label_color), tip.text.c_str());
}

}   // namespace wedge

#endif   // WEDGE_USE_IMGUI
