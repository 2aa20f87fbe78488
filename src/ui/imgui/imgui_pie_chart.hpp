#pragma once

#ifdef WEDGE_USE_IMGUI

    #include <imgui.h>
    #include <wedge/chart_surface.hpp>

namespace wedge
{

class ImGuiDrawContext;

// Immediate-mode host for a ChartSurface: the chart occupies one ImGui item,
// the item rectangle is the container, and the mouse position is forwarded
// as pointer-move events while the item is hovered.
class ImGuiPieChart : public ChartContainer
{
   public:
    explicit ImGuiPieChart(const ChartConfig& config = {});

    ImGuiPieChart(const ImGuiPieChart&)            = delete;
    ImGuiPieChart& operator=(const ImGuiPieChart&) = delete;

    // Call once per frame inside a window. size <= 0 on an axis fills the
    // available content region. Returns true while the chart is hovered.
    bool draw(const char* id, const ValueSet& values, const ColorPair& colors, ImVec2 size = {});

    ContentBox content_box() const override { return box_; }

    ChartSurface&       surface() { return surface_; }
    const ChartSurface& surface() const { return surface_; }

   private:
    void draw_tooltip() const;

    ChartSurface      surface_;
    ImGuiDrawContext* context_ = nullptr;   // owned by surface_
    ContentBox        box_;
};

}   // namespace wedge

#endif   // WEDGE_USE_IMGUI
