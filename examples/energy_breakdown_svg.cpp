#include <cmath>
#include <iostream>
#include <memory>
#include <wedge/wedge.hpp>

// Renders an energy breakdown to energy_breakdown.svg and sweeps the pointer
// around the chart to show which slices only reveal their label on hover.

namespace
{

struct FixedContainer : wedge::ChartContainer
{
    wedge::ContentBox box;

    wedge::ContentBox content_box() const override { return box; }
};

}   // namespace

int main()
{
    wedge::Logger::instance().set_level(wedge::LogLevel::Debug);
    wedge::Logger::instance().add_sink(wedge::sinks::console_sink());

    FixedContainer container;
    container.box = {20.0f, 40.0f, 320.0f, 320.0f};

    wedge::ChartSurface chart({.device_pixel_scale = 2.0f});
    if (!chart.initialize(container, std::make_unique<wedge::DisplayList>()))
        return 1;

    chart.set_tooltip_callback(
        [](const wedge::TooltipState& tip)
        {
            if (tip.visible)
                std::cout << "tooltip: " << tip.text << " at (" << tip.left << ", " << tip.top
                          << ")\n";
            else
                std::cout << "tooltip hidden\n";
        });

    wedge::ValueSet values{
        {"Coal", 412.0},
        {"Natural Gas", 236.0},
        {"Oil", 180.0},
        {"Hydro", 61.0},
        {"Wind", 22.0},
        {"Solar", 9.5},
        {"Geothermal", 3.1},   // under 1%, dropped
    };

    chart.clear();
    chart.render(values, wedge::ramps::energy);

    const auto& geom = *chart.geometry();
    for (const auto& slice : chart.slices())
    {
        float angle = slice.bisector();
        float x     = container.box.x + geom.center.x + geom.radius * 0.75f * std::cos(angle);
        float y     = container.box.y + geom.center.y + geom.radius * 0.75f * std::sin(angle);
        chart.on_pointer_move({x, y});
    }
    chart.on_pointer_leave();

    const auto* list = static_cast<const wedge::DisplayList*>(chart.context());
    if (!wedge::SvgExporter::write_svg("energy_breakdown.svg", *list))
        return 1;

    std::cout << "Saved energy_breakdown.svg\n";
    return 0;
}
